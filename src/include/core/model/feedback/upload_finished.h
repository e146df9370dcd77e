#pragma once

#include <core/model/transfer_outcome.h>
#include <nlohmann/json.hpp>
#include <string>

namespace reup::core::feedback {

struct UploadFinished {
    std::string filename;
    std::string upload_id;
    TransferOutcome outcome;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UploadFinished, filename, upload_id, outcome);
};

} // namespace reup::core::feedback
