#include <boost/asio/error.hpp>
#include <boost/beast/core/error.hpp>
#include <core/network/client/transfer_fault.h>
#include <spdlog/fmt/fmt.h>

namespace net = boost::asio;
namespace beast = boost::beast;

namespace reup::core {

std::string_view FaultKindToString(FaultKind kind) {
    switch (kind) {
    case FaultKind::kTimeout:
        return "timeout";
    case FaultKind::kTransport:
        return "transport";
    case FaultKind::kProtocol:
        return "protocol";
    case FaultKind::kSizeMismatch:
        return "size mismatch";
    }
    return "unknown";
}

TruncatedFrame::TruncatedFrame(std::size_t expected, std::size_t available)
    : TransferFault(FaultKind::kProtocol,
                    fmt::format("truncated frame: expected {} bytes, {} available",
                                expected,
                                available)) {}

TransferFault ClassifyTransportError(const boost::system::error_code& ec, std::string_view what) {
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return TransferFault(FaultKind::kTimeout, fmt::format("{} timed out", what));
    }
    if (ec == net::error::connection_refused) {
        return TransferFault(FaultKind::kTransport, fmt::format("{}: connection refused", what));
    }
    if (ec == net::error::connection_reset || ec == net::error::broken_pipe
        || ec == net::error::connection_aborted || ec == net::error::not_connected) {
        return TransferFault(FaultKind::kTransport,
                             fmt::format("{}: connection broken ({})", what, ec.message()));
    }
    if (ec == net::error::eof) {
        return TransferFault(FaultKind::kProtocol,
                             fmt::format("{}: peer closed the connection", what));
    }
    return TransferFault(FaultKind::kTransport, fmt::format("{}: {}", what, ec.message()));
}

} // namespace reup::core
