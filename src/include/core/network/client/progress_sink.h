#pragma once

#include <cstdint>

namespace reup::core {

// Receives byte counts from the transfer hot path. `bytes_done` includes the resumed
// offset and never decreases within one logical upload. Implementations must not block.
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void OnProgress(std::uint64_t bytes_done, std::uint64_t bytes_total) noexcept = 0;
};

class NullProgressSink : public ProgressSink {
public:
    void OnProgress(std::uint64_t, std::uint64_t) noexcept override {}
};

// Forwards only counts at or above the highest one seen since Reset(). A resumed attempt
// restarts from the server's offset, which can be below what an earlier attempt already
// handed to the socket.
class MonotonicProgressSink : public ProgressSink {
public:
    explicit MonotonicProgressSink(ProgressSink* target)
        : target_(target) {}

    void OnProgress(std::uint64_t bytes_done, std::uint64_t bytes_total) noexcept override {
        if (bytes_done < highest_) {
            return;
        }
        highest_ = bytes_done;
        target_->OnProgress(bytes_done, bytes_total);
    }

    void Reset() noexcept { highest_ = 0; }

    std::uint64_t highest() const { return highest_; }

private:
    ProgressSink* target_;
    std::uint64_t highest_ = 0;
};

} // namespace reup::core
