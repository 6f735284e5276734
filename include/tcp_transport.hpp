#pragma once

#include "transport.hpp"
#include <array>
#include <atomic>
#include <boost/asio.hpp>
#include <deque>
#include <memory>
#include <thread>

namespace ferry {

using tcp = boost::asio::ip::tcp;

// Upper bound for one framed message on the wire.
const uint32_t MAX_FRAME_SIZE = 64 * 1024 * 1024;

// Transport over one TCP connection. Every message is a protobuf Frame
// preceded by its 4-byte big-endian length. A background thread runs the
// io_context; reads land in per-channel queues, writes are queued and
// issued one at a time.
class TcpTransport : public Transport {
public:
    // Blocking connect. Throws IoError.
    static std::unique_ptr<TcpTransport> connect(const std::string& host, const std::string& port);
    // Blocks until one peer connects on `port`. Throws IoError.
    static std::unique_ptr<TcpTransport> accept(unsigned short port);

    ~TcpTransport() override;

    void send(uint32_t channel_id, const std::string& payload, bool fin = false) override;
    std::vector<uint32_t> readable() const override;
    std::optional<InboundMessage> receive(uint32_t channel_id, std::chrono::milliseconds timeout) override;
    // Flushes queued writes, then shuts the connection down.
    void close() override;
    bool is_open() const override;

private:
    TcpTransport(std::unique_ptr<boost::asio::io_context> io_context, tcp::socket socket);

    void start();
    void do_read_header();
    void do_read_body(uint32_t length);
    void do_write();
    void shutdown_socket();
    void fail(const std::string& reason);

    std::unique_ptr<boost::asio::io_context> io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    tcp::socket socket_;
    std::thread io_thread_;
    std::shared_ptr<ChannelQueues> inbound_;

    // Touched only on the I/O thread.
    std::array<uint8_t, 4> header_{};
    std::vector<uint8_t> body_;
    std::deque<std::shared_ptr<std::string>> write_queue_;
    bool closing_ = false;

    std::atomic<bool> open_{true};
    bool joined_ = false;
};

} // namespace ferry
