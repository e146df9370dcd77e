#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <core/network/client/transfer_fault.h>
#include <core/network/client/upload_session.h>
#include <core/security/fingerprint.h>
#include <fstream>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace reup::core {

namespace {

class SourceUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string hexBytes(const BinaryData& bytes) {
    std::string out;
    for (auto byte : bytes) {
        out += fmt::format("{:02x}", byte);
    }
    return out;
}

} // namespace

UploadSession::UploadSession(boost::asio::io_context& ioc,
                             Settings settings,
                             RetryPolicy retry_policy,
                             ProgressSink* progress,
                             FeedbackCallback callback,
                             std::unique_ptr<TransferEngine> engine)
    : ioc_(ioc)
    , settings_(std::move(settings))
    , retry_policy_(retry_policy)
    , progress_(progress ? progress : &null_progress_)
    , monotonic_progress_(progress_)
    , callback_(std::move(callback))
    , engine_(engine ? std::move(engine)
                     : std::make_unique<TransferEngine>(TransferOptions::FromSettings(settings_)))
    , retry_timer_(ioc) {
    engine_->set_progress_sink(&monotonic_progress_);
    engine_->set_cancellation(&cancellation_);
}

UploadSession::~UploadSession() {
    Disconnect();
}

void UploadSession::setState(UploadState state) {
    auto previous = state_.exchange(state);
    if (previous != state) {
        spdlog::debug("Upload state: {} -> {}",
                      UploadStateToString(previous),
                      UploadStateToString(state));
    }
}

boost::asio::awaitable<bool> UploadSession::Connect() {
    if (connection_) {
        co_return true;
    }
    try {
        co_await connect();
        co_return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to {}:{}: {}", settings_.host, settings_.port, e.what());
    }
    Disconnect();
    co_return false;
}

void UploadSession::Disconnect() {
    if (connection_) {
        connection_->Close();
        connection_.reset();
        spdlog::debug("Connection closed");
    }
}

void UploadSession::Cancel() {
    spdlog::info("Cancelling upload");
    cancellation_.Cancel();
    boost::asio::post(ioc_, [this]() {
        if (connection_) {
            connection_->Cancel();
        }
        retry_timer_.cancel();
    });
}

boost::asio::awaitable<void> UploadSession::connect() {
    cancellation_.ThrowIfCancelled();
    setState(UploadState::kConnecting);
    ++attempts_;
    spdlog::info("Connecting to server {}:{}...", settings_.host, settings_.port);
    // Owned before the first suspension so Cancel() reaches resolve and connect
    connection_ = std::make_unique<StreamConnection>(ioc_.get_executor(),
                                                     ConnectionOptions::FromSettings(settings_));
    co_await connection_->Open(settings_.host, settings_.port);
    spdlog::info("Connected to {}", connection_->remote_address());
}

UploadRequest UploadSession::prepareRequest(const fs::path& file_path) const {
    std::error_code ec;
    if (!fs::exists(file_path, ec)) {
        throw SourceUnavailable(fmt::format("file {} not found", file_path.string()));
    }
    if (!fs::is_regular_file(file_path, ec)) {
        throw SourceUnavailable(fmt::format("{} is not a regular file", file_path.string()));
    }
    std::ifstream probe(file_path, std::ios::binary);
    if (!probe) {
        throw SourceUnavailable(fmt::format("file {} is not readable", file_path.string()));
    }

    UploadRequest request;
    request.client_name = settings_.client_name;
    request.file_path = file_path;
    request.filename = file_path.filename().string();
    request.file_size = fs::file_size(file_path);
    request.upload_id = Fingerprint::Compute(request.client_name,
                                             request.filename,
                                             request.file_size,
                                             file_path);
    return request;
}

boost::asio::awaitable<StatusReply> UploadSession::runAttempt(const UploadRequest& request) {
    if (!connection_) {
        co_await connect();
    }
    cancellation_.ThrowIfCancelled();

    spdlog::info("Uploading {} ({} bytes), upload_id={}, attempt={}",
                 request.filename,
                 request.file_size,
                 request.upload_id,
                 attempts_);

    connection_->Write(wire::EncodeHeader(request.client_name,
                                          request.filename,
                                          request.file_size,
                                          request.upload_id));
    co_await connection_->Flush(settings_.drain_timeout);

    setState(UploadState::kAwaitingOffset);
    auto offset_bytes = co_await connection_->ReadExactly(wire::kOffsetSize,
                                                          settings_.offset_timeout,
                                                          "read resume offset");
    std::uint64_t offset = wire::DecodeU64(offset_bytes);
    if (offset > request.file_size) {
        throw TransferFault(FaultKind::kProtocol,
                            fmt::format("server returned offset {} beyond file size {}",
                                        offset,
                                        request.file_size));
    }

    std::uint64_t remaining = request.file_size - offset;
    if (remaining > 0) {
        setState(UploadState::kTransferring);
        if (offset > 0) {
            spdlog::info("Resuming at offset {}, {} bytes remaining", offset, remaining);
        }

        // A fresh handle per attempt, the position comes from an explicit seek
        std::vector<char> file_buffer(settings_.file_buffer_size);
        std::ifstream file;
        file.rdbuf()->pubsetbuf(file_buffer.data(),
                                static_cast<std::streamsize>(file_buffer.size()));
        file.open(request.file_path, std::ios::binary);
        if (!file) {
            throw SourceUnavailable(
                fmt::format("file {} is no longer readable", request.file_path.string()));
        }

        std::uint64_t sent = co_await engine_->Send(*connection_, file, remaining, offset);
        bytes_sent_ += sent;
        if (sent != remaining) {
            throw TransferFault(FaultKind::kSizeMismatch,
                                fmt::format("sent {}/{} bytes", sent, remaining));
        }
    } else {
        spdlog::info("Server already holds the complete file, waiting for confirmation");
        monotonic_progress_.OnProgress(request.file_size, request.file_size);
    }

    setState(UploadState::kAwaitingStatus);
    auto status_bytes = co_await connection_->ReadExactly(wire::kStatusSize,
                                                          settings_.response_timeout,
                                                          "read status");
    StatusReply status = wire::DecodeStatus(status_bytes);
    if (status == StatusReply::kUnexpected) {
        spdlog::warn("Unexpected response from server: 0x{}", hexBytes(status_bytes));
    }
    co_return status;
}

TransferOutcome UploadSession::finish(const UploadRequest& request,
                                      OutcomeKind kind,
                                      std::string reason) {
    Disconnect();
    setState(kind == OutcomeKind::kSucceeded ? UploadState::kSucceeded : UploadState::kFailed);

    TransferOutcome outcome{kind, std::move(reason), attempts_, bytes_sent_};
    feedback({FeedbackType::kUploadFinished,
              feedback::UploadFinished{request.filename, request.upload_id, outcome}});
    return outcome;
}

boost::asio::awaitable<TransferOutcome> UploadSession::Upload(const fs::path& file_path) {
    attempts_ = connection_ ? 1 : 0;
    bytes_sent_ = 0;
    monotonic_progress_.Reset();

    UploadRequest request;
    request.file_path = file_path;
    request.filename = file_path.filename().string();
    try {
        request = prepareRequest(file_path);
    } catch (const std::exception& e) {
        spdlog::error("Cannot upload {}: {}", file_path.string(), e.what());
        co_return finish(request, OutcomeKind::kSourceUnavailable, e.what());
    }

    feedback({FeedbackType::kUploadStarted,
              feedback::UploadStarted{request.filename, request.file_size, request.upload_id}});

    std::uint32_t failures = 0;
    while (true) {
        std::optional<TransferFault> fault;
        std::optional<std::string> fatal;
        try {
            StatusReply status = co_await runAttempt(request);
            switch (status) {
            case StatusReply::kOk:
                spdlog::info("Server confirmed {}", request.filename);
                co_return finish(request, OutcomeKind::kSucceeded, "");
            case StatusReply::kError:
                spdlog::error("Server rejected {}", request.filename);
                co_return finish(request,
                                 OutcomeKind::kServerRejected,
                                 "server replied ER");
            case StatusReply::kUnexpected:
                co_return finish(request,
                                 OutcomeKind::kProtocolViolation,
                                 "unexpected status reply");
            }
        } catch (const OperationCancelled&) {
            // handled below with the other cancellation paths
        } catch (const SourceUnavailable& e) {
            fatal = e.what();
        } catch (const TransferFault& e) {
            fault = e;
        } catch (const std::exception& e) {
            fault = TransferFault(FaultKind::kTransport, e.what());
        }

        if (cancellation_.IsCancelled()) {
            spdlog::info("Upload of {} cancelled", request.filename);
            co_return finish(request, OutcomeKind::kCancelled, "cancelled");
        }
        if (fatal) {
            spdlog::error("Cannot upload {}: {}", request.filename, *fatal);
            co_return finish(request, OutcomeKind::kSourceUnavailable, *fatal);
        }
        if (!fault) {
            // runAttempt only returns through the switch above
            fault = TransferFault(FaultKind::kProtocol, "attempt ended without a status");
        }

        ++failures;
        spdlog::warn("Transfer interrupted ({}): {}. Reconnecting...",
                     FaultKindToString(fault->kind()),
                     fault->what());
        Disconnect();

        if (!retry_policy_.ShouldRetry(failures)) {
            spdlog::error("Retry limit of {} attempts reached, upload of {} not completed",
                          retry_policy_.max_attempts(),
                          request.filename);
            co_return finish(request,
                             OutcomeKind::kAttemptsExhausted,
                             fmt::format("{} attempts failed, last error: {}",
                                         failures,
                                         fault->what()));
        }

        auto delay = retry_policy_.DelayFor(failures);
        setState(UploadState::kReconnecting);
        feedback({FeedbackType::kUploadRetrying,
                  feedback::UploadRetrying{request.upload_id,
                                           failures,
                                           fault->kind(),
                                           fault->what(),
                                           static_cast<std::int64_t>(delay.count())}});

        boost::system::error_code ec;
        retry_timer_.expires_after(delay);
        co_await retry_timer_.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (cancellation_.IsCancelled()) {
            spdlog::info("Upload of {} cancelled", request.filename);
            co_return finish(request, OutcomeKind::kCancelled, "cancelled");
        }
    }
}

} // namespace reup::core
