#pragma once

#include <boost/asio/awaitable.hpp>
#include <chrono>
#include <core/network/client/progress_sink.h>
#include <core/network/client/stream_connection.h>
#include <core/util/cancellation.h>
#include <core/util/config.h>
#include <cstdint>
#include <istream>

namespace reup::core {

struct TransferOptions {
    std::size_t chunk_size = transfer::kDefaultChunkSize;
    std::chrono::milliseconds drain_timeout = transfer::kDefaultDrainTimeout;

    static TransferOptions FromSettings(const Settings& settings);
};

// Streams a region of a file through a connection. The returned count may be smaller than
// requested when the source ends early; callers must treat that as a failed transfer.
class TransferEngine {
public:
    explicit TransferEngine(TransferOptions options = {});
    virtual ~TransferEngine() = default;

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    virtual net::awaitable<std::uint64_t> Send(StreamConnection& connection,
                                               std::istream& file,
                                               std::uint64_t size_to_send,
                                               std::uint64_t start_offset);

    void set_progress_sink(ProgressSink* sink) { progress_ = sink ? sink : &null_progress_; }
    void set_cancellation(const CancellationSignal* signal) { cancellation_ = signal; }

    const TransferOptions& options() const { return options_; }
    std::size_t chunks_sent() const { return chunks_sent_; }

private:
    TransferOptions options_;
    NullProgressSink null_progress_;
    ProgressSink* progress_ = &null_progress_;
    const CancellationSignal* cancellation_ = nullptr;
    std::size_t chunks_sent_ = 0;
};

} // namespace reup::core
