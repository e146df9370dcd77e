#pragma once

#include <nlohmann/json.hpp>

namespace reup::core {

enum class UploadState {
    kIdle,           // no upload running
    kConnecting,     // opening a transport session
    kAwaitingOffset, // header sent, waiting for the resume offset
    kTransferring,   // streaming file bytes
    kAwaitingStatus, // all bytes handed over, waiting for OK/ER
    kReconnecting,   // transport fault, backing off before the next attempt
    kSucceeded,      // server confirmed with OK
    kFailed,         // terminal failure
};

NLOHMANN_JSON_SERIALIZE_ENUM(UploadState,
                             {
                                 {UploadState::kIdle, "Idle"},
                                 {UploadState::kConnecting, "Connecting"},
                                 {UploadState::kAwaitingOffset, "AwaitingOffset"},
                                 {UploadState::kTransferring, "Transferring"},
                                 {UploadState::kAwaitingStatus, "AwaitingStatus"},
                                 {UploadState::kReconnecting, "Reconnecting"},
                                 {UploadState::kSucceeded, "Succeeded"},
                                 {UploadState::kFailed, "Failed"},
                             });

inline const char* UploadStateToString(UploadState state) {
    switch (state) {
    case UploadState::kIdle:
        return "Idle";
    case UploadState::kConnecting:
        return "Connecting";
    case UploadState::kAwaitingOffset:
        return "AwaitingOffset";
    case UploadState::kTransferring:
        return "Transferring";
    case UploadState::kAwaitingStatus:
        return "AwaitingStatus";
    case UploadState::kReconnecting:
        return "Reconnecting";
    case UploadState::kSucceeded:
        return "Succeeded";
    case UploadState::kFailed:
        return "Failed";
    }
    return "Unknown";
}

} // namespace reup::core
