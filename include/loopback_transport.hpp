#pragma once

#include "transport.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace ferry {

// In-process transport: two connected ends sharing memory queues.
class LoopbackTransport : public Transport {
public:
    // Returning false drops the outgoing message, simulating loss.
    using SendFilter = std::function<bool(uint32_t channel_id, const std::string& payload, bool fin)>;

    static std::pair<std::unique_ptr<LoopbackTransport>, std::unique_ptr<LoopbackTransport>> make_pair();

    ~LoopbackTransport() override;

    void send(uint32_t channel_id, const std::string& payload, bool fin = false) override;
    std::vector<uint32_t> readable() const override;
    std::optional<InboundMessage> receive(uint32_t channel_id, std::chrono::milliseconds timeout) override;
    void close() override;
    bool is_open() const override;

    void set_send_filter(SendFilter filter) { filter_ = std::move(filter); }
    uint64_t messages_sent(uint32_t channel_id) const;

private:
    LoopbackTransport(std::shared_ptr<ChannelQueues> inbound, std::shared_ptr<ChannelQueues> outbound);

    std::shared_ptr<ChannelQueues> inbound_;
    std::shared_ptr<ChannelQueues> outbound_;
    SendFilter filter_;
    mutable std::mutex stats_mutex_;
    std::map<uint32_t, uint64_t> sent_;
};

} // namespace ferry
