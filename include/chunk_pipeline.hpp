#pragma once

#include "chunk_record.hpp"
#include "file_chunker.hpp"
#include <boost/asio/thread_pool.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace ferry {

// Reads, digests and compresses chunks on a worker pool, one bounded batch at
// a time, and hands the records to a single consumer in strictly increasing
// index order.
class ChunkPipeline {
public:
    using Consumer = std::function<void(ChunkRecord&&)>;

    // worker_threads == 0 picks the hardware concurrency.
    ChunkPipeline(const FileChunker& chunker, size_t worker_threads, size_t batch_size);
    ~ChunkPipeline();

    ChunkPipeline(const ChunkPipeline&) = delete;
    ChunkPipeline& operator=(const ChunkPipeline&) = delete;

    // Prepares `indices` (any order, duplicates ignored). The first worker
    // error of a batch is rethrown on the calling thread after the batch
    // has drained; records already consumed stay consumed.
    void run(const std::vector<uint64_t>& indices, const Consumer& consumer);

    // Every chunk of the file.
    void run_all(const Consumer& consumer);

    size_t worker_threads() const { return worker_threads_; }
    size_t batch_size() const { return batch_size_; }

private:
    std::vector<ChunkRecord> prepare_batch(const std::vector<uint64_t>& batch);

    const FileChunker& chunker_;
    size_t worker_threads_;
    size_t batch_size_;
    boost::asio::thread_pool pool_;
};

} // namespace ferry
