#include "mock_peer.h"
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <core/network/client/stream_connection.h>
#include <core/network/client/transfer_fault.h>
#include <gtest/gtest.h>
#include <optional>

using namespace reup::core;
using namespace reup::test;
using namespace std::chrono_literals;

namespace {

std::uint16_t unusedPort(net::io_context& ioc) {
    tcp::acceptor acceptor(ioc, tcp::endpoint(net::ip::make_address("127.0.0.1"), 0));
    return acceptor.local_endpoint().port();
}

net::awaitable<std::optional<FaultKind>> connectFault(std::uint16_t port) {
    try {
        auto connection = co_await StreamConnection::Connect("127.0.0.1", port, ConnectionOptions{});
    } catch (const TransferFault& fault) {
        co_return fault.kind();
    }
    co_return std::nullopt;
}

net::awaitable<std::optional<FaultKind>> readFault(std::uint16_t port,
                                                   std::size_t size,
                                                   std::chrono::milliseconds timeout) {
    auto connection = co_await StreamConnection::Connect("127.0.0.1", port, ConnectionOptions{});
    try {
        co_await connection->ReadExactly(size, timeout, "test read");
    } catch (const TransferFault& fault) {
        co_return fault.kind();
    }
    co_return std::nullopt;
}

struct DrainResult {
    std::size_t queued = 0;
    std::size_t after_drain = 0;
    std::size_t after_flush = 0;
    std::uint64_t written = 0;
};

net::awaitable<DrainResult> drainScenario(std::uint16_t port, ConnectionOptions options) {
    auto connection = co_await StreamConnection::Connect("127.0.0.1", port, options);
    DrainResult result;
    BinaryData payload(1024 * 1024, 0x5a);
    connection->Write(payload);
    result.queued = connection->BufferedAmount();
    co_await connection->Drain(5s);
    result.after_drain = connection->BufferedAmount();
    co_await connection->Flush(5s);
    result.after_flush = connection->BufferedAmount();
    result.written = connection->total_written();
    connection->Close();
    co_return result;
}

net::awaitable<BinaryData> exchange(std::uint16_t port) {
    auto connection = co_await StreamConnection::Connect("127.0.0.1", port, ConnectionOptions{});
    connection->Write(wire::EncodeU64(41));
    co_await connection->Flush(5s);
    auto reply = co_await connection->ReadExactly(8, 5s, "reply");
    connection->Close();
    co_return reply;
}

net::awaitable<std::optional<FaultKind>> drainFault(std::uint16_t port,
                                                    std::chrono::milliseconds timeout) {
    ConnectionOptions options;
    options.socket_buffer_size = 64 * 1024;
    options.high_watermark = 256 * 1024;
    options.low_watermark = 64 * 1024;
    auto connection = co_await StreamConnection::Connect("127.0.0.1", port, options);
    connection->Write(BinaryData(8 * 1024 * 1024, 0x33));
    try {
        co_await connection->Drain(timeout);
    } catch (const TransferFault& fault) {
        co_return fault.kind();
    }
    co_return std::nullopt;
}

net::awaitable<bool> openAfterCancel(std::uint16_t port) {
    StreamConnection connection(co_await net::this_coro::executor, ConnectionOptions{});
    connection.Cancel();
    try {
        co_await connection.Open("127.0.0.1", port);
    } catch (const OperationCancelled&) {
        co_return true;
    }
    co_return false;
}

} // namespace

TEST(StreamConnectionTest, RefusedConnectIsTransportFault) {
    net::io_context ioc;
    auto port = unusedPort(ioc);
    auto fault = RunUntilComplete(ioc, connectFault(port));
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(*fault, FaultKind::kTransport);
}

TEST(StreamConnectionTest, PeerClosingMidFrameIsTruncation) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        co_await MockPeer::WriteRaw(socket, "abc");
        socket.close();
    });
    auto fault = RunUntilComplete(ioc, readFault(peer.port(), 8, 5s));
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(*fault, FaultKind::kProtocol);
}

TEST(StreamConnectionTest, SilentPeerTimesOut) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        co_await MockPeer::ReadUntilClosed(socket);
    });
    auto fault = RunUntilComplete(ioc, readFault(peer.port(), 8, 100ms));
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(*fault, FaultKind::kTimeout);
}

TEST(StreamConnectionTest, ReadsExactlyRequestedBytes) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        auto request = co_await MockPeer::ReadBytes(socket, 8);
        co_await MockPeer::WriteOffset(socket, wire::DecodeU64(request) + 1);
        co_await MockPeer::ReadUntilClosed(socket);
    });
    auto reply = RunUntilComplete(ioc, exchange(peer.port()));
    EXPECT_EQ(wire::DecodeU64(reply), 42u);
}

TEST(StreamConnectionTest, DrainStopsAtLowWatermarkAndFlushEmpties) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        co_await MockPeer::ReadUntilClosed(socket);
    });

    ConnectionOptions options;
    options.high_watermark = 256 * 1024;
    options.low_watermark = 64 * 1024;
    auto result = RunUntilComplete(ioc, drainScenario(peer.port(), options));

    EXPECT_EQ(result.queued, 1024u * 1024);
    EXPECT_LE(result.after_drain, options.low_watermark);
    EXPECT_EQ(result.after_flush, 0u);
    EXPECT_EQ(result.written, 1024u * 1024);
}

TEST(StreamConnectionTest, OptionsComeFromSettings) {
    Settings settings;
    settings.connect_timeout = 3s;
    settings.write_buffer_high = 1000;
    settings.write_buffer_low = 5000;
    auto options = ConnectionOptions::FromSettings(settings);
    EXPECT_EQ(options.connect_timeout, 3s);
    EXPECT_EQ(options.high_watermark, 1000u);
    EXPECT_EQ(options.low_watermark, 1000u);
}

TEST(StreamConnectionTest, DrainAgainstStalledPeerTimesOut) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        co_await MockPeer::Stall(socket, 10s);
    });
    auto fault = RunUntilComplete(ioc, drainFault(peer.port(), 100ms));
    ASSERT_TRUE(fault.has_value());
    EXPECT_EQ(*fault, FaultKind::kTimeout);
}

TEST(StreamConnectionTest, CancelBeforeOpenSkipsConnect) {
    net::io_context ioc;
    MockPeer peer(ioc, [](tcp::socket& socket, std::size_t) -> net::awaitable<void> {
        co_await MockPeer::ReadUntilClosed(socket);
    });
    EXPECT_TRUE(RunUntilComplete(ioc, openAfterCancel(peer.port())));
    EXPECT_EQ(peer.connections(), 0u);
}
