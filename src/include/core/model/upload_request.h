#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace reup::core {

// Fixed for the lifetime of one logical upload, every reconnect reuses it
struct UploadRequest {
    std::string client_name;
    std::filesystem::path file_path;
    std::string filename;
    std::uint64_t file_size = 0;
    std::string upload_id;
};

} // namespace reup::core
