#include "tcp_transport.hpp"
#include "errors.hpp"
#include "ferry.pb.h"
#include <iostream>

namespace ferry {

namespace {

void put_be32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>((value >> 24) & 0xff));
    out.push_back(static_cast<char>((value >> 16) & 0xff));
    out.push_back(static_cast<char>((value >> 8) & 0xff));
    out.push_back(static_cast<char>(value & 0xff));
}

uint32_t get_be32(const std::array<uint8_t, 4>& in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

} // namespace

std::unique_ptr<TcpTransport> TcpTransport::connect(const std::string& host, const std::string& port) {
    auto io_context = std::make_unique<boost::asio::io_context>();
    tcp::resolver resolver(*io_context);
    boost::system::error_code ec;
    auto endpoints = resolver.resolve(host, port, ec);
    if (ec) {
        throw IoError(host + ":" + port, "cannot resolve: " + ec.message());
    }

    tcp::socket socket(*io_context);
    boost::asio::connect(socket, endpoints, ec);
    if (ec) {
        throw IoError(host + ":" + port, "connect failed: " + ec.message());
    }
    std::cout << "[Transport] Connected to " << host << ":" << port << std::endl;

    std::unique_ptr<TcpTransport> transport(new TcpTransport(std::move(io_context), std::move(socket)));
    transport->start();
    return transport;
}

std::unique_ptr<TcpTransport> TcpTransport::accept(unsigned short port) {
    auto io_context = std::make_unique<boost::asio::io_context>();
    boost::system::error_code ec;
    tcp::acceptor acceptor(*io_context);
    tcp::endpoint endpoint(tcp::v4(), port);
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor.listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        throw IoError("port " + std::to_string(port), "cannot listen: " + ec.message());
    }
    std::cout << "[Transport] Listening on port " << port << std::endl;

    tcp::socket socket(*io_context);
    acceptor.accept(socket, ec);
    if (ec) {
        throw IoError("port " + std::to_string(port), "accept failed: " + ec.message());
    }
    std::cout << "[Transport] Accepted connection from " << socket.remote_endpoint(ec) << std::endl;

    std::unique_ptr<TcpTransport> transport(new TcpTransport(std::move(io_context), std::move(socket)));
    transport->start();
    return transport;
}

TcpTransport::TcpTransport(std::unique_ptr<boost::asio::io_context> io_context, tcp::socket socket)
    : io_context_(std::move(io_context)),
      work_guard_(boost::asio::make_work_guard(*io_context_)),
      socket_(std::move(socket)),
      inbound_(std::make_shared<ChannelQueues>()) {}

TcpTransport::~TcpTransport() {
    close();
}

void TcpTransport::start() {
    boost::asio::post(*io_context_, [this]() { do_read_header(); });
    io_thread_ = std::thread([this]() { io_context_->run(); });
}

void TcpTransport::do_read_header() {
    boost::asio::async_read(socket_, boost::asio::buffer(header_),
        [this](const boost::system::error_code& ec, std::size_t /*length*/) {
            if (ec) {
                fail(ec == boost::asio::error::eof ? "peer closed the connection" : "read error: " + ec.message());
                return;
            }
            uint32_t length = get_be32(header_);
            if (length > MAX_FRAME_SIZE) {
                fail("frame of " + std::to_string(length) + " bytes exceeds the limit");
                return;
            }
            do_read_body(length);
        });
}

void TcpTransport::do_read_body(uint32_t length) {
    body_.resize(length);
    boost::asio::async_read(socket_, boost::asio::buffer(body_),
        [this](const boost::system::error_code& ec, std::size_t length) {
            if (ec) {
                fail("read error: " + ec.message());
                return;
            }
            wire::Frame frame;
            if (!frame.ParseFromArray(body_.data(), static_cast<int>(length))) {
                fail("failed to parse frame");
                return;
            }
            inbound_->push(InboundMessage{frame.channel(), frame.payload(), frame.fin()});
            do_read_header();
        });
}

void TcpTransport::send(uint32_t channel_id, const std::string& payload, bool fin) {
    if (!open_) {
        throw IoError("tcp", "send on closed transport");
    }
    wire::Frame frame;
    frame.set_channel(channel_id);
    frame.set_fin(fin);
    frame.set_payload(payload);

    std::string body;
    if (!frame.SerializeToString(&body)) {
        throw ProtocolViolation("Failed to serialize frame for channel " + std::to_string(channel_id));
    }
    if (body.size() > MAX_FRAME_SIZE) {
        throw ProtocolViolation("Frame of " + std::to_string(body.size()) + " bytes exceeds the limit");
    }

    // Use a shared_ptr for the buffer so it lives until the write is complete
    auto buffer = std::make_shared<std::string>();
    buffer->reserve(body.size() + 4);
    put_be32(*buffer, static_cast<uint32_t>(body.size()));
    buffer->append(body);

    boost::asio::post(*io_context_, [this, buffer]() {
        if (!socket_.is_open()) {
            return;
        }
        write_queue_.push_back(buffer);
        if (write_queue_.size() == 1) {
            do_write();
        }
    });
}

void TcpTransport::do_write() {
    // The handler holds the buffer: fail() may empty the queue first.
    std::shared_ptr<std::string> buffer = write_queue_.front();
    boost::asio::async_write(socket_, boost::asio::buffer(*buffer),
        [this, buffer](const boost::system::error_code& ec, std::size_t /*length*/) {
            if (ec) {
                fail("write error: " + ec.message());
                return;
            }
            if (!open_ || write_queue_.empty() || write_queue_.front() != buffer) {
                return;
            }
            write_queue_.pop_front();
            if (!write_queue_.empty()) {
                do_write();
            } else if (closing_) {
                shutdown_socket();
            }
        });
}

void TcpTransport::shutdown_socket() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

void TcpTransport::fail(const std::string& reason) {
    if (open_.exchange(false) && !closing_) {
        std::cerr << "[Transport] " << reason << std::endl;
    }
    inbound_->close(reason);
    write_queue_.clear();
    shutdown_socket();
}

std::vector<uint32_t> TcpTransport::readable() const {
    return inbound_->readable();
}

std::optional<InboundMessage> TcpTransport::receive(uint32_t channel_id, std::chrono::milliseconds timeout) {
    return inbound_->pop(channel_id, timeout);
}

void TcpTransport::close() {
    if (joined_) {
        return;
    }
    boost::asio::post(*io_context_, [this]() {
        closing_ = true;
        if (write_queue_.empty()) {
            shutdown_socket();
        }
    });
    work_guard_.reset();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    joined_ = true;
    open_ = false;
    inbound_->close("closed locally");
}

bool TcpTransport::is_open() const {
    return open_;
}

} // namespace ferry
