#include "chunk_pipeline.hpp"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <condition_variable>
#include <exception>
#include <iterator>
#include <mutex>
#include <set>
#include <thread>

namespace ferry {

namespace {

size_t resolve_threads(size_t requested) {
    if (requested > 0) {
        return requested;
    }
    unsigned int hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 1;
}

} // namespace

ChunkPipeline::ChunkPipeline(const FileChunker& chunker, size_t worker_threads, size_t batch_size)
    : chunker_(chunker),
      worker_threads_(resolve_threads(worker_threads)),
      batch_size_(batch_size > 0 ? batch_size : 1),
      pool_(worker_threads_) {}

ChunkPipeline::~ChunkPipeline() {
    pool_.join();
}

std::vector<ChunkRecord> ChunkPipeline::prepare_batch(const std::vector<uint64_t>& batch) {
    std::mutex mutex;
    std::condition_variable done_cv;
    size_t pending = batch.size();
    std::vector<ChunkRecord> records;
    records.reserve(batch.size());
    std::exception_ptr first_error;

    for (uint64_t index : batch) {
        boost::asio::post(pool_, [&, index]() {
            ChunkRecord record;
            std::exception_ptr error;
            try {
                record = chunker_.read_chunk(index);
            } catch (...) {
                error = std::current_exception();
            }

            std::lock_guard<std::mutex> lock(mutex);
            if (error) {
                if (!first_error) {
                    first_error = error;
                }
            } else {
                records.push_back(std::move(record));
            }
            if (--pending == 0) {
                done_cv.notify_one();
            }
        });
    }

    std::unique_lock<std::mutex> lock(mutex);
    done_cv.wait(lock, [&]() { return pending == 0; });
    if (first_error) {
        std::rethrow_exception(first_error);
    }

    // Workers finish in any order.
    std::sort(records.begin(), records.end(),
        [](const ChunkRecord& a, const ChunkRecord& b) { return a.index < b.index; });
    return records;
}

void ChunkPipeline::run(const std::vector<uint64_t>& indices, const Consumer& consumer) {
    std::set<uint64_t> ordered(indices.begin(), indices.end());
    std::vector<uint64_t> batch;
    batch.reserve(batch_size_);

    for (auto it = ordered.begin(); it != ordered.end(); ++it) {
        batch.push_back(*it);
        if (batch.size() == batch_size_ || std::next(it) == ordered.end()) {
            for (auto& record : prepare_batch(batch)) {
                consumer(std::move(record));
            }
            batch.clear();
        }
    }
}

void ChunkPipeline::run_all(const Consumer& consumer) {
    std::vector<uint64_t> indices;
    uint64_t total = chunker_.total_chunks() ? *chunker_.total_chunks() : 0;
    indices.reserve(static_cast<size_t>(total));
    for (uint64_t i = 0; i < total; ++i) {
        indices.push_back(i);
    }
    run(indices, consumer);
}

} // namespace ferry
