#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace reup::core {

// Upload identity derived from file metadata only. Two uploads of the same file from the
// same client map to the same id, which lets the server resume a partial transfer after a
// reconnect or a process restart. Content is never read, so a file rewritten in place with
// identical size and mtime keeps its old identity.
class Fingerprint {
public:
    static std::string Compute(std::string_view client_name,
                               std::string_view filename,
                               std::uint64_t file_size,
                               const std::filesystem::path& path);

    static std::string Compute(std::string_view client_name,
                               std::string_view filename,
                               std::uint64_t file_size,
                               std::int64_t mtime_ns);

    // Modification time in nanoseconds since the Unix epoch
    static std::int64_t ModificationTimeNs(const std::filesystem::path& path);
};

} // namespace reup::core
