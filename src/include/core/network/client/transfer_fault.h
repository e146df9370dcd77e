#pragma once

#include <boost/system/error_code.hpp>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <string_view>

namespace reup::core {

// Faults the upload session recovers from by reconnecting
enum class FaultKind {
    kTimeout,      // connect, offset, status or drain deadline expired
    kTransport,    // reset, broken pipe, refused, generic I/O
    kProtocol,     // truncated frame, offset beyond file size
    kSizeMismatch, // bytes sent differ from bytes expected
};

NLOHMANN_JSON_SERIALIZE_ENUM(FaultKind,
                             {
                                 {FaultKind::kTimeout, "Timeout"},
                                 {FaultKind::kTransport, "Transport"},
                                 {FaultKind::kProtocol, "Protocol"},
                                 {FaultKind::kSizeMismatch, "SizeMismatch"},
                             });

std::string_view FaultKindToString(FaultKind kind);

class TransferFault : public std::runtime_error {
public:
    TransferFault(FaultKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    FaultKind kind() const noexcept { return kind_; }

private:
    FaultKind kind_;
};

class TruncatedFrame : public TransferFault {
public:
    TruncatedFrame(std::size_t expected, std::size_t available);
};

// Raised by cancellation checks, never retried
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled()
        : std::runtime_error("operation cancelled") {}
};

// Maps a platform error to the fault taxonomy, `what` names the failed operation
TransferFault ClassifyTransportError(const boost::system::error_code& ec, std::string_view what);

} // namespace reup::core
