#pragma once

#include <cstdlib>
#include <filesystem>

namespace reup::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "reup"
                                             / "logs";

inline const std::filesystem::path kConfigDir = []() -> std::filesystem::path {
#if defined(_WIN32) || defined(_WIN64)
    const char* base = std::getenv("APPDATA");
    return std::filesystem::path(base ? base : ".") / "reup";
#else
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".") / ".config" / "reup";
#endif
}();

inline const std::filesystem::path kDefaultConfigFile = kConfigDir / "config.toml";

} // namespace path
} // namespace reup::core
