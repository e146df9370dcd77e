#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace reup::core {

namespace transfer {

constexpr size_t kDefaultChunkSize = 4 * 1024 * 1024;   // 4 MB
constexpr size_t kMaxChunkSize = 64 * 1024 * 1024;      // 64 MB
constexpr size_t kDefaultSocketBufferSize = 4 * 1024 * 1024;
constexpr size_t kDefaultFileBufferSize = 4 * 1024 * 1024;

// Outbound buffer thresholds, drain is only awaited above the high mark
constexpr size_t kDefaultHighWatermark = 32 * 1024 * 1024;
constexpr size_t kDefaultLowWatermark = 8 * 1024 * 1024;

constexpr std::chrono::milliseconds kDefaultConnectTimeout{10'000};
constexpr std::chrono::milliseconds kDefaultResponseTimeout{30'000};
constexpr std::chrono::milliseconds kDefaultOffsetTimeout{120'000};
constexpr std::chrono::milliseconds kDefaultDrainTimeout{30'000};

constexpr std::uint32_t kDefaultMaxRetries = 0; // 0 = unlimited
constexpr std::chrono::milliseconds kDefaultRetryDelay{2'000};
constexpr std::chrono::milliseconds kDefaultMaxRetryDelay{60'000};

constexpr std::uint16_t kDefaultServerPort = 8888;
constexpr const char* kDefaultServerHost = "127.0.0.1";
constexpr const char* kDefaultClientName = "default_client";

} // namespace transfer

} // namespace reup::core
