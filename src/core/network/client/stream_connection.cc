#include <algorithm>
#include <boost/asio/buffer.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/client/stream_connection.h>
#include <core/network/client/transfer_fault.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

using tcp = boost::asio::ip::tcp;

namespace reup::core {

ConnectionOptions ConnectionOptions::FromSettings(const Settings& settings) {
    ConnectionOptions options;
    options.connect_timeout = settings.connect_timeout;
    options.socket_buffer_size = settings.socket_buffer_size;
    options.high_watermark = settings.write_buffer_high;
    options.low_watermark = std::min(settings.write_buffer_low, settings.write_buffer_high);
    return options;
}

net::awaitable<std::unique_ptr<StreamConnection>> StreamConnection::Connect(
    std::string_view host, std::uint16_t port, const ConnectionOptions& options) {
    auto connection = std::make_unique<StreamConnection>(co_await net::this_coro::executor,
                                                         options);
    co_await connection->Open(host, port);
    co_return connection;
}

StreamConnection::StreamConnection(net::any_io_executor executor,
                                   const ConnectionOptions& options)
    : resolver_(executor)
    , stream_(executor)
    , options_(options) {}

net::awaitable<void> StreamConnection::Open(std::string_view host, std::uint16_t port) {
    if (cancelled_) {
        throw OperationCancelled();
    }
    boost::system::error_code ec;

    auto results = co_await resolver_.async_resolve(std::string(host),
                                                    std::to_string(port),
                                                    net::redirect_error(net::use_awaitable,
                                                                        ec));
    if (cancelled_) {
        throw OperationCancelled();
    }
    if (ec) {
        throw ClassifyTransportError(ec, fmt::format("resolve {}", host));
    }

    stream_.expires_after(options_.connect_timeout);
    co_await stream_.async_connect(results, net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();
    if (cancelled_) {
        throw OperationCancelled();
    }
    if (ec) {
        throw ClassifyTransportError(ec, fmt::format("connect to {}:{}", host, port));
    }

    auto endpoint = stream_.socket().remote_endpoint(ec);
    if (!ec) {
        remote_address_ = fmt::format("{}:{}", endpoint.address().to_string(), endpoint.port());
    }
    tune();
}

StreamConnection::~StreamConnection() {
    Close();
}

void StreamConnection::tune() {
    auto& socket = stream_.socket();
    boost::system::error_code ec;

    socket.set_option(tcp::no_delay(true), ec);
    if (ec) {
        spdlog::debug("Failed to set TCP_NODELAY: {}", ec.message());
    }
    socket.set_option(net::socket_base::keep_alive(true), ec);
    if (ec) {
        spdlog::debug("Failed to set SO_KEEPALIVE: {}", ec.message());
    }
    int buffer_size = static_cast<int>(options_.socket_buffer_size);
    socket.set_option(net::socket_base::receive_buffer_size(buffer_size), ec);
    if (ec) {
        spdlog::debug("Failed to set SO_RCVBUF: {}", ec.message());
    }
    socket.set_option(net::socket_base::send_buffer_size(buffer_size), ec);
    if (ec) {
        spdlog::debug("Failed to set SO_SNDBUF: {}", ec.message());
    }
}

void StreamConnection::Write(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return;
    }
    auto dest = outbound_.prepare(data.size());
    net::buffer_copy(dest, net::buffer(data.data(), data.size()));
    outbound_.commit(data.size());
}

net::awaitable<void> StreamConnection::writeDownTo(std::size_t threshold,
                                                   std::chrono::milliseconds timeout,
                                                   std::string_view what) {
    if (outbound_.size() <= threshold) {
        co_return;
    }
    if (closed_) {
        throw TransferFault(FaultKind::kTransport, fmt::format("{}: connection closed", what));
    }

    boost::system::error_code ec;
    stream_.expires_after(timeout);
    while (outbound_.size() > threshold) {
        std::size_t written = co_await stream_.async_write_some(outbound_.data(),
                                                                net::redirect_error(
                                                                    net::use_awaitable,
                                                                    ec));
        if (ec) {
            stream_.expires_never();
            throw ClassifyTransportError(ec, what);
        }
        outbound_.consume(written);
        total_written_ += written;
    }
    stream_.expires_never();
}

net::awaitable<void> StreamConnection::Drain(std::chrono::milliseconds timeout) {
    co_await writeDownTo(options_.low_watermark, timeout, "drain");
}

net::awaitable<void> StreamConnection::Flush(std::chrono::milliseconds timeout) {
    co_await writeDownTo(0, timeout, "flush");
}

net::awaitable<BinaryData> StreamConnection::ReadExactly(std::size_t size,
                                                         std::chrono::milliseconds timeout,
                                                         std::string_view what) {
    if (closed_) {
        throw TransferFault(FaultKind::kTransport, fmt::format("{}: connection closed", what));
    }

    BinaryData data(size);
    boost::system::error_code ec;
    stream_.expires_after(timeout);
    std::size_t received = co_await net::async_read(stream_,
                                                    net::buffer(data),
                                                    net::redirect_error(net::use_awaitable, ec));
    stream_.expires_never();

    if (ec) {
        if (ec == net::error::eof) {
            spdlog::debug("{}: peer closed after {} of {} bytes", what, received, size);
            throw TruncatedFrame(size, received);
        }
        throw ClassifyTransportError(ec, what);
    }
    co_return data;
}

void StreamConnection::Cancel() noexcept {
    cancelled_ = true;
    resolver_.cancel();
    boost::system::error_code ec;
    stream_.socket().cancel(ec);
    if (ec) {
        spdlog::debug("Socket cancel notice: {}", ec.message());
    }
}

void StreamConnection::Close() noexcept {
    if (closed_) {
        return;
    }
    closed_ = true;

    auto& socket = stream_.socket();
    if (!socket.is_open()) {
        return;
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    if (ec && ec != net::error::not_connected) {
        spdlog::debug("Socket shutdown notice: {}", ec.message());
    }
    stream_.close();
    outbound_.clear();
}

} // namespace reup::core
