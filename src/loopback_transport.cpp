#include "loopback_transport.hpp"
#include "errors.hpp"

namespace ferry {

std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>>
LoopbackTransport::make_pair() {
    auto a_to_b = std::make_shared<ChannelQueues>();
    auto b_to_a = std::make_shared<ChannelQueues>();
    std::unique_ptr<LoopbackTransport> a(new LoopbackTransport(b_to_a, a_to_b));
    std::unique_ptr<LoopbackTransport> b(new LoopbackTransport(a_to_b, b_to_a));
    return {std::move(a), std::move(b)};
}

LoopbackTransport::LoopbackTransport(std::shared_ptr<ChannelQueues> inbound,
                                     std::shared_ptr<ChannelQueues> outbound)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

LoopbackTransport::~LoopbackTransport() {
    close();
}

void LoopbackTransport::send(uint32_t channel_id, const std::string& payload, bool fin) {
    if (outbound_->closed()) {
        throw IoError("loopback", "send on closed transport");
    }
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        ++sent_[channel_id];
    }
    if (filter_ && !filter_(channel_id, payload, fin)) {
        return;
    }
    outbound_->push(InboundMessage{channel_id, payload, fin});
}

std::vector<uint32_t> LoopbackTransport::readable() const {
    return inbound_->readable();
}

std::optional<InboundMessage> LoopbackTransport::receive(uint32_t channel_id,
                                                         std::chrono::milliseconds timeout) {
    return inbound_->pop(channel_id, timeout);
}

void LoopbackTransport::close() {
    // The peer still drains what was already delivered.
    outbound_->close("peer closed");
    inbound_->close("closed locally");
}

bool LoopbackTransport::is_open() const {
    return !outbound_->closed();
}

uint64_t LoopbackTransport::messages_sent(uint32_t channel_id) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto it = sent_.find(channel_id);
    return it == sent_.end() ? 0 : it->second;
}

} // namespace ferry
