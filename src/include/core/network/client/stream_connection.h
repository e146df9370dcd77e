#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/multi_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <chrono>
#include <core/protocol/wire_codec.h>
#include <core/util/config.h>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace reup::core {

namespace net = boost::asio;
namespace beast = boost::beast;

struct ConnectionOptions {
    std::chrono::milliseconds connect_timeout = transfer::kDefaultConnectTimeout;
    std::size_t socket_buffer_size = transfer::kDefaultSocketBufferSize;
    std::size_t high_watermark = transfer::kDefaultHighWatermark;
    std::size_t low_watermark = transfer::kDefaultLowWatermark;

    static ConnectionOptions FromSettings(const Settings& settings);
};

// One live TCP session of an upload attempt. Outgoing bytes are queued in a user space
// buffer by Write() and handed to the socket by Drain()/Flush(). Every failure leaves the
// object as a TransferFault, raw error codes never escape.
class StreamConnection {
public:
    // Constructs and opens in one step
    static net::awaitable<std::unique_ptr<StreamConnection>> Connect(
        std::string_view host, std::uint16_t port, const ConnectionOptions& options);

    // Not connected until Open() completes
    StreamConnection(net::any_io_executor executor, const ConnectionOptions& options);
    ~StreamConnection();

    StreamConnection(const StreamConnection&) = delete;
    StreamConnection& operator=(const StreamConnection&) = delete;

    // Throws TransferFault on resolve/connect failure or when connect_timeout expires,
    // OperationCancelled when Cancel() came first
    net::awaitable<void> Open(std::string_view host, std::uint16_t port);

    void Write(std::span<const std::uint8_t> data);

    // Suspends until the queued bytes fall to the low watermark
    net::awaitable<void> Drain(std::chrono::milliseconds timeout);

    // Suspends until every queued byte has been handed to the socket
    net::awaitable<void> Flush(std::chrono::milliseconds timeout);

    // Exactly `size` bytes or a fault; `what` names the read in error messages
    net::awaitable<BinaryData> ReadExactly(std::size_t size,
                                           std::chrono::milliseconds timeout,
                                           std::string_view what);

    // Aborts the pending operation, resolve and connect included. It completes with a
    // fault, and a later Open() fails.
    void Cancel() noexcept;

    void Close() noexcept;

    bool IsOpen() const { return !closed_ && stream_.socket().is_open(); }

    std::size_t BufferedAmount() const { return outbound_.size(); }
    std::size_t high_watermark() const { return options_.high_watermark; }
    std::size_t low_watermark() const { return options_.low_watermark; }
    std::uint64_t total_written() const { return total_written_; }
    const std::string& remote_address() const { return remote_address_; }

private:
    void tune();
    net::awaitable<void> writeDownTo(std::size_t threshold,
                                     std::chrono::milliseconds timeout,
                                     std::string_view what);

    boost::asio::ip::tcp::resolver resolver_;
    beast::tcp_stream stream_;
    beast::multi_buffer outbound_;
    ConnectionOptions options_;
    std::uint64_t total_written_ = 0;
    std::string remote_address_;
    bool cancelled_ = false;
    bool closed_ = false;
};

} // namespace reup::core
