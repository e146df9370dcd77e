#include <algorithm>
#include <cmath>
#include <core/util/config.h>
#include <fstream>
#include <limits>
#include <spdlog/spdlog.h>

namespace reup::core {

namespace {

// Upper bound for any duration in the config, about 68 years
constexpr double kMaxDurationSeconds = std::numeric_limits<std::int32_t>::max();

std::chrono::milliseconds secondsToMillis(double seconds) {
    return std::chrono::milliseconds(static_cast<std::int64_t>(seconds * 1000.0));
}

double millisToSeconds(std::chrono::milliseconds ms) {
    return static_cast<double>(ms.count()) / 1000.0;
}

std::size_t readSize(const toml::table& table, std::string_view key, std::size_t fallback) {
    std::int64_t value = table[key].value_or(static_cast<std::int64_t>(fallback));
    if (value <= 0) {
        spdlog::warn("Config value \"{}\" must be positive, using {}", key, fallback);
        return fallback;
    }
    return static_cast<std::size_t>(value);
}

std::chrono::milliseconds readTimeout(const toml::table& table,
                                      std::string_view key,
                                      std::chrono::milliseconds fallback) {
    double value = table[key].value_or(millisToSeconds(fallback));
    if (!std::isfinite(value) || value < 0.0 || value > kMaxDurationSeconds) {
        spdlog::warn("Config value \"{}\" must be between 0 and {}s, using {}s",
                     key,
                     kMaxDurationSeconds,
                     millisToSeconds(fallback));
        return fallback;
    }
    return secondsToMillis(value);
}

} // namespace

static void LoadSetting() {
    if (!config.contains("upload")) {
        config.insert("upload", toml::table{});
    }
    auto& upload = config["upload"].ref<toml::table>();
    const Settings defaults;

    settings.host = upload["host"].value_or(defaults.host);
    std::int64_t port = upload["port"].value_or(static_cast<std::int64_t>(defaults.port));
    if (port <= 0 || port > 65535) {
        spdlog::warn("Config port {} is out of range, using {}", port, defaults.port);
        port = defaults.port;
    }
    settings.port = static_cast<std::uint16_t>(port);
    settings.client_name = upload["client-name"].value_or(defaults.client_name);

    settings.chunk_size = std::min(readSize(upload, "chunk-size", defaults.chunk_size),
                                   transfer::kMaxChunkSize);
    settings.socket_buffer_size = readSize(upload,
                                           "socket-buffer-size",
                                           defaults.socket_buffer_size);
    settings.file_buffer_size = readSize(upload, "file-buffer-size", defaults.file_buffer_size);
    settings.write_buffer_high = readSize(upload, "write-buffer-high", defaults.write_buffer_high);
    settings.write_buffer_low = readSize(upload, "write-buffer-low", defaults.write_buffer_low);
    if (settings.write_buffer_low > settings.write_buffer_high) {
        spdlog::warn("write-buffer-low ({}) exceeds write-buffer-high ({}), clamping",
                     settings.write_buffer_low,
                     settings.write_buffer_high);
        settings.write_buffer_low = settings.write_buffer_high;
    }

    settings.connect_timeout = readTimeout(upload, "connect-timeout", defaults.connect_timeout);
    settings.response_timeout = readTimeout(upload, "response-timeout", defaults.response_timeout);
    settings.offset_timeout = readTimeout(upload, "offset-timeout", defaults.offset_timeout);
    settings.drain_timeout = readTimeout(upload, "drain-timeout", defaults.drain_timeout);

    std::int64_t retries = upload["max-retries"].value_or(
        static_cast<std::int64_t>(defaults.max_retries));
    if (retries < 0 || retries > std::numeric_limits<std::uint32_t>::max()) {
        spdlog::warn("Config max-retries {} is out of range, using {}",
                     retries,
                     defaults.max_retries);
        retries = defaults.max_retries;
    }
    settings.max_retries = static_cast<std::uint32_t>(retries);
    settings.retry_delay = readTimeout(upload, "retry-delay", defaults.retry_delay);
    settings.max_retry_delay = readTimeout(upload, "max-retry-delay", defaults.max_retry_delay);

    std::string backoff = upload["retry-backoff"].value_or(std::string("fixed"));
    if (backoff == "exponential") {
        settings.retry_backoff = RetryBackoff::kExponential;
    } else {
        if (backoff != "fixed") {
            spdlog::warn("Unknown retry-backoff \"{}\", using fixed", backoff);
        }
        settings.retry_backoff = RetryBackoff::kFixed;
    }
}

void InitConfig(const std::filesystem::path& path) {
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
        spdlog::info("Config directory does not exist, creating...");
        std::filesystem::create_directories(path.parent_path());
    }
    if (!std::filesystem::exists(path)) {
        std::ofstream ofs(path);
        spdlog::info("Config file does not exist, creating...");
    }
    try {
        config = toml::parse_file(path.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", path.string(), err.description());
        config = toml::table{};
    }

    LoadSetting();
}

void SaveConfig(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (!ofs.is_open()) {
        spdlog::error("Failed to open \"{}\" for saving config.", path.string());
        return;
    }
    config.insert_or_assign(
        "upload",
        toml::table{
            {"host", settings.host},
            {"port", static_cast<std::int64_t>(settings.port)},
            {"client-name", settings.client_name},
            {"chunk-size", static_cast<std::int64_t>(settings.chunk_size)},
            {"socket-buffer-size", static_cast<std::int64_t>(settings.socket_buffer_size)},
            {"file-buffer-size", static_cast<std::int64_t>(settings.file_buffer_size)},
            {"write-buffer-high", static_cast<std::int64_t>(settings.write_buffer_high)},
            {"write-buffer-low", static_cast<std::int64_t>(settings.write_buffer_low)},
            {"connect-timeout", millisToSeconds(settings.connect_timeout)},
            {"response-timeout", millisToSeconds(settings.response_timeout)},
            {"offset-timeout", millisToSeconds(settings.offset_timeout)},
            {"drain-timeout", millisToSeconds(settings.drain_timeout)},
            {"max-retries", static_cast<std::int64_t>(settings.max_retries)},
            {"retry-delay", millisToSeconds(settings.retry_delay)},
            {"max-retry-delay", millisToSeconds(settings.max_retry_delay)},
            {"retry-backoff",
             settings.retry_backoff == RetryBackoff::kExponential ? "exponential" : "fixed"},
        });
    ofs << config;
}

} // namespace reup::core
