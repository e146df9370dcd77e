#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace reup::core::feedback {

struct UploadStarted {
    std::string filename;
    std::uint64_t file_size;
    std::string upload_id;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(UploadStarted, filename, file_size, upload_id);
};

} // namespace reup::core::feedback
