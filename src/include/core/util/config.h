/*
    config.h
    Application configuration backed by a TOML file. All tunables of the upload
    core live in the [upload] table.

    Example config.toml:

        [upload]
        host = "10.0.0.5"
        port = 8888
        client-name = "station-7"
        chunk-size = 4194304
        connect-timeout = 10.0      # seconds
        max-retries = 0             # 0 = retry forever
        retry-delay = 2.0
        retry-backoff = "fixed"     # or "exponential"

    Usage:
    - Load (creates an empty file when missing, missing keys take defaults):
        reup::core::InitConfig();
    - Read:
        std::string host = reup::core::settings.host;
    - Write back:
        reup::core::settings.max_retries = 5;
        reup::core::SaveConfig();
*/

#pragma once

#include <chrono>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <cstdint>
#include <filesystem>
#include <string>
#include <toml++/toml.h>

namespace reup::core {

inline toml::table config;

enum class RetryBackoff {
    kFixed,
    kExponential,
};

struct Settings {
    std::string host = transfer::kDefaultServerHost;
    std::uint16_t port = transfer::kDefaultServerPort;
    std::string client_name = transfer::kDefaultClientName; // Identity sent in every header

    std::size_t chunk_size = transfer::kDefaultChunkSize;
    std::size_t socket_buffer_size = transfer::kDefaultSocketBufferSize; // SO_SNDBUF / SO_RCVBUF
    std::size_t file_buffer_size = transfer::kDefaultFileBufferSize;
    std::size_t write_buffer_high = transfer::kDefaultHighWatermark;
    std::size_t write_buffer_low = transfer::kDefaultLowWatermark;

    std::chrono::milliseconds connect_timeout = transfer::kDefaultConnectTimeout;
    std::chrono::milliseconds response_timeout = transfer::kDefaultResponseTimeout;
    std::chrono::milliseconds offset_timeout = transfer::kDefaultOffsetTimeout;
    std::chrono::milliseconds drain_timeout = transfer::kDefaultDrainTimeout;

    std::uint32_t max_retries = transfer::kDefaultMaxRetries;
    std::chrono::milliseconds retry_delay = transfer::kDefaultRetryDelay;
    std::chrono::milliseconds max_retry_delay = transfer::kDefaultMaxRetryDelay;
    RetryBackoff retry_backoff = RetryBackoff::kFixed;
};

inline Settings settings;

void InitConfig(const std::filesystem::path& path = path::kDefaultConfigFile);

void SaveConfig(const std::filesystem::path& path = path::kDefaultConfigFile);

} // namespace reup::core
