#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace reup::core {

enum class OutcomeKind {
    kSucceeded,         // server answered OK
    kServerRejected,    // server answered ER, never retried
    kProtocolViolation, // unrecognized status bytes, never retried
    kAttemptsExhausted, // retry budget spent on transport faults
    kSourceUnavailable, // local file missing or unreadable, checked before connecting
    kCancelled,         // cancelled by the caller
};

NLOHMANN_JSON_SERIALIZE_ENUM(OutcomeKind,
                             {
                                 {OutcomeKind::kSucceeded, "Succeeded"},
                                 {OutcomeKind::kServerRejected, "ServerRejected"},
                                 {OutcomeKind::kProtocolViolation, "ProtocolViolation"},
                                 {OutcomeKind::kAttemptsExhausted, "AttemptsExhausted"},
                                 {OutcomeKind::kSourceUnavailable, "SourceUnavailable"},
                                 {OutcomeKind::kCancelled, "Cancelled"},
                             });

struct TransferOutcome {
    OutcomeKind kind = OutcomeKind::kAttemptsExhausted;
    std::string reason;
    std::uint32_t attempts = 0;   // connection attempts made
    std::uint64_t bytes_sent = 0; // file bytes written across all attempts

    bool success() const { return kind == OutcomeKind::kSucceeded; }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(TransferOutcome, kind, reason, attempts, bytes_sent);
};

} // namespace reup::core
