#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ferry {

// Logical channels multiplexed over one connection.
namespace channel {
const uint32_t CONTROL = 0;
const uint32_t MANIFEST = 4;
const uint32_t DATA = 8;
const uint32_t HASH_CHECK = 16;
const uint32_t RESUME = 20;
}

struct InboundMessage {
    uint32_t channel = 0;
    std::string payload;
    // Closes the current round on this channel (end-of-round marker on DATA).
    bool fin = false;
};

// Per-channel FIFO of delivered messages, shared between the thread that
// produces them (peer or I/O thread) and the transfer thread.
class ChannelQueues {
public:
    void push(InboundMessage message);

    // Waits up to `timeout` for a message on `channel_id`. Returns nullopt on
    // timeout. Throws IoError once closed and drained.
    std::optional<InboundMessage> pop(uint32_t channel_id, std::chrono::milliseconds timeout);

    std::vector<uint32_t> readable() const;
    size_t buffered(uint32_t channel_id) const;

    void close(const std::string& reason);
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint32_t, std::deque<InboundMessage>> queues_;
    bool closed_ = false;
    std::string close_reason_;
};

// Message-oriented, channel-multiplexed link to the peer. The transfer
// engine never sees sockets.
class Transport {
public:
    virtual ~Transport() = default;

    // Throws IoError if the link is down.
    virtual void send(uint32_t channel_id, const std::string& payload, bool fin = false) = 0;

    // Channels with buffered inbound messages.
    virtual std::vector<uint32_t> readable() const = 0;

    // Bounded wait for the next message on one channel. nullopt on timeout;
    // IoError once the link is closed and nothing is buffered.
    virtual std::optional<InboundMessage> receive(uint32_t channel_id,
                                                  std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;
};

} // namespace ferry
