#include "transport.hpp"
#include "errors.hpp"

namespace ferry {

void ChannelQueues::push(InboundMessage message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        queues_[message.channel].push_back(std::move(message));
    }
    cv_.notify_all();
}

std::optional<InboundMessage> ChannelQueues::pop(uint32_t channel_id, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto has_message = [&]() {
        auto it = queues_.find(channel_id);
        return it != queues_.end() && !it->second.empty();
    };
    cv_.wait_for(lock, timeout, [&]() { return closed_ || has_message(); });

    if (has_message()) {
        auto& queue = queues_[channel_id];
        InboundMessage message = std::move(queue.front());
        queue.pop_front();
        return message;
    }
    if (closed_) {
        throw IoError("channel " + std::to_string(channel_id), "transport closed: " + close_reason_);
    }
    return std::nullopt;
}

std::vector<uint32_t> ChannelQueues::readable() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<uint32_t> channels;
    for (const auto& entry : queues_) {
        if (!entry.second.empty()) {
            channels.push_back(entry.first);
        }
    }
    return channels;
}

size_t ChannelQueues::buffered(uint32_t channel_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(channel_id);
    return it == queues_.end() ? 0 : it->second.size();
}

void ChannelQueues::close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        close_reason_ = reason;
    }
    cv_.notify_all();
}

bool ChannelQueues::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace ferry
