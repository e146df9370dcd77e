#pragma once

#include <chrono>
#include <core/network/client/progress_sink.h>
#include <cstdint>
#include <string>

namespace reup::cli {

// One-line terminal progress bar
class ProgressDisplay : public core::ProgressSink {
public:
    explicit ProgressDisplay(std::string filename);
    ~ProgressDisplay() override;

    void OnProgress(std::uint64_t bytes_done, std::uint64_t bytes_total) noexcept override;

    void ClearProgress();

private:
    void printProgress(std::uint64_t bytes_done, std::uint64_t bytes_total);

    std::string filename_;
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point last_draw_;
    std::uint64_t first_bytes_ = 0;
    bool started_drawing_ = false;
    bool drawn_ = false;
};

} // namespace reup::cli
