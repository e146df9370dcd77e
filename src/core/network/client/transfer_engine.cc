#include <algorithm>
#include <core/network/client/transfer_engine.h>
#include <core/network/client/transfer_fault.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace reup::core {

TransferOptions TransferOptions::FromSettings(const Settings& settings) {
    TransferOptions options;
    options.chunk_size = std::clamp<std::size_t>(settings.chunk_size, 1, transfer::kMaxChunkSize);
    options.drain_timeout = settings.drain_timeout;
    return options;
}

TransferEngine::TransferEngine(TransferOptions options)
    : options_(options) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = transfer::kDefaultChunkSize;
    }
}

net::awaitable<std::uint64_t> TransferEngine::Send(StreamConnection& connection,
                                                   std::istream& file,
                                                   std::uint64_t size_to_send,
                                                   std::uint64_t start_offset) {
    chunks_sent_ = 0;

    file.clear();
    file.seekg(static_cast<std::streamoff>(start_offset), std::ios::beg);
    if (!file) {
        throw TransferFault(FaultKind::kSizeMismatch,
                            fmt::format("cannot seek source to offset {}", start_offset));
    }

    const std::uint64_t total = start_offset + size_to_send;
    std::vector<char> chunk(static_cast<std::size_t>(
        std::min<std::uint64_t>(options_.chunk_size, size_to_send)));
    std::uint64_t sent = 0;

    while (sent < size_to_send) {
        if (cancellation_) {
            cancellation_->ThrowIfCancelled();
        }

        auto wanted = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, size_to_send - sent));
        file.read(chunk.data(), static_cast<std::streamsize>(wanted));
        auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            spdlog::warn("Source ended early: {} of {} bytes read", sent, size_to_send);
            break;
        }

        connection.Write({reinterpret_cast<const std::uint8_t*>(chunk.data()), got});
        // Drain only above the high watermark
        if (connection.BufferedAmount() > connection.high_watermark()) {
            co_await connection.Drain(options_.drain_timeout);
        }

        sent += got;
        ++chunks_sent_;
        progress_->OnProgress(start_offset + sent, total);

        if (got < wanted) {
            spdlog::warn("Source ended early: {} of {} bytes read", sent, size_to_send);
            break;
        }
    }

    // Everything must reach the socket before the caller waits for the status reply
    co_await connection.Flush(options_.drain_timeout);

    spdlog::debug("Sent {} bytes in {} chunks from offset {}", sent, chunks_sent_, start_offset);
    co_return sent;
}

} // namespace reup::core
