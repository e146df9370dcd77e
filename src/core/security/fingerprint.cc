#include <cerrno>
#include <chrono>
#include <core/security/fingerprint.h>
#include <iomanip>
#include <memory>
#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>
#include <sstream>
#include <stdexcept>
#include <system_error>

#if !defined(_WIN32) && !defined(_WIN64)
#include <sys/stat.h>
#endif

namespace reup::core {

std::int64_t Fingerprint::ModificationTimeNs(const std::filesystem::path& path) {
#if defined(_WIN32) || defined(_WIN64)
    auto ftime = std::filesystem::last_write_time(path);
    auto sctp = std::chrono::clock_cast<std::chrono::system_clock>(ftime);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(sctp.time_since_epoch()).count();
#else
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        throw std::filesystem::filesystem_error("cannot stat file",
                                                path,
                                                std::error_code(errno, std::generic_category()));
    }
    return static_cast<std::int64_t>(st.st_mtim.tv_sec) * 1'000'000'000
           + static_cast<std::int64_t>(st.st_mtim.tv_nsec);
#endif
}

std::string Fingerprint::Compute(std::string_view client_name,
                                 std::string_view filename,
                                 std::uint64_t file_size,
                                 const std::filesystem::path& path) {
    return Compute(client_name, filename, file_size, ModificationTimeNs(path));
}

std::string Fingerprint::Compute(std::string_view client_name,
                                 std::string_view filename,
                                 std::uint64_t file_size,
                                 std::int64_t mtime_ns) {
    std::string seed = fmt::format("{}|{}|{}|{}", client_name, filename, file_size, mtime_ns);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> mdctx(EVP_MD_CTX_new(),
                                                                  &EVP_MD_CTX_free);
    if (!mdctx || EVP_DigestInit_ex(mdctx.get(), EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(mdctx.get(), seed.data(), seed.size()) != 1) {
        throw std::runtime_error("Failed to compute upload fingerprint");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(mdctx.get(), hash, &hash_len) != 1) {
        throw std::runtime_error("Failed to compute upload fingerprint");
    }

    // Convert hash to hex string
    std::stringstream ss;
    for (unsigned int i = 0; i < hash_len; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }

    return ss.str();
}

} // namespace reup::core
