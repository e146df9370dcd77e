#pragma once

#include <core/network/client/transfer_fault.h>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace reup::core::feedback {

struct UploadRetrying {
    std::string upload_id;
    std::uint32_t attempt;
    FaultKind fault;
    std::string reason;
    std::int64_t delay_ms;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UploadRetrying, upload_id, attempt, fault, reason, delay_ms);
};

} // namespace reup::core::feedback
