#pragma once

#include <atomic>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <core/model.h>
#include <core/network/client/progress_sink.h>
#include <core/network/client/stream_connection.h>
#include <core/network/client/transfer_engine.h>
#include <core/protocol/wire_codec.h>
#include <core/util/cancellation.h>
#include <core/util/config.h>
#include <core/util/retry_policy.h>
#include <filesystem>
#include <memory>

namespace reup::core {

// Uploads one file at a time and resumes after connection loss from the offset the server
// reports for the upload id. Transport faults are retried according to the RetryPolicy;
// verdicts from the server (OK, ER or anything else) end the upload.
//
// The session must outlive every coroutine it hands out, and all of them must run on the
// io_context passed to the constructor.
class UploadSession {
public:
    UploadSession(boost::asio::io_context& ioc,
                  Settings settings,
                  RetryPolicy retry_policy,
                  ProgressSink* progress = nullptr,
                  FeedbackCallback callback = nullptr,
                  std::unique_ptr<TransferEngine> engine = nullptr);
    ~UploadSession();
    UploadSession(const UploadSession&) = delete;
    UploadSession& operator=(const UploadSession&) = delete;

    // Opens the connection ahead of Upload(); false when the server is unreachable
    boost::asio::awaitable<bool> Connect();

    void Disconnect();

    boost::asio::awaitable<TransferOutcome> Upload(const std::filesystem::path& file_path);

    // Thread-safe. A cancelled session stays cancelled.
    void Cancel();

    bool IsCancelled() const { return cancellation_.IsCancelled(); }
    bool IsConnected() const { return connection_ && connection_->IsOpen(); }

    UploadState state() const { return state_.load(); }
    std::uint32_t attempts() const { return attempts_; }

private:
    UploadRequest prepareRequest(const std::filesystem::path& file_path) const;

    boost::asio::awaitable<void> connect();
    boost::asio::awaitable<StatusReply> runAttempt(const UploadRequest& request);

    TransferOutcome finish(const UploadRequest& request, OutcomeKind kind, std::string reason);

    void setState(UploadState state);

    void feedback(Feedback&& feedback) {
        if (callback_) {
            callback_(std::move(feedback));
        }
    }

    boost::asio::io_context& ioc_;
    Settings settings_;
    RetryPolicy retry_policy_;
    NullProgressSink null_progress_;
    ProgressSink* progress_;
    MonotonicProgressSink monotonic_progress_;
    FeedbackCallback callback_;
    std::unique_ptr<TransferEngine> engine_;
    std::unique_ptr<StreamConnection> connection_;
    boost::asio::steady_timer retry_timer_;
    CancellationSignal cancellation_;

    std::atomic<UploadState> state_ = UploadState::kIdle;
    std::uint32_t attempts_ = 0;
    std::uint64_t bytes_sent_ = 0;
};

} // namespace reup::core
