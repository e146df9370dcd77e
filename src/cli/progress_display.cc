#include <cli/progress_display.h>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace reup::cli {

namespace {

constexpr int kBarWidth = 30;
constexpr auto kRedrawInterval = std::chrono::milliseconds(200);

std::string humanBytes(double bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    int unit = 0;
    while (bytes >= 1024.0 && unit < 4) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << units[unit];
    return ss.str();
}

} // namespace

ProgressDisplay::ProgressDisplay(std::string filename)
    : filename_(std::move(filename)) {}

ProgressDisplay::~ProgressDisplay() {
    ClearProgress();
}

void ProgressDisplay::OnProgress(std::uint64_t bytes_done, std::uint64_t bytes_total) noexcept {
    auto now = std::chrono::steady_clock::now();
    if (!started_drawing_) {
        started_drawing_ = true;
        started_ = now;
        first_bytes_ = bytes_done;
    } else if (bytes_done < bytes_total && now - last_draw_ < kRedrawInterval) {
        return;
    }
    last_draw_ = now;
    printProgress(bytes_done, bytes_total);
}

void ProgressDisplay::printProgress(std::uint64_t bytes_done, std::uint64_t bytes_total) {
    double ratio = bytes_total > 0 ? static_cast<double>(bytes_done) / bytes_total : 1.0;
    int filled = static_cast<int>(ratio * kBarWidth);

    double elapsed = std::chrono::duration<double>(last_draw_ - started_).count();
    double rate = elapsed > 0.0 ? static_cast<double>(bytes_done - first_bytes_) / elapsed : 0.0;

    std::cout << "\r" << filename_ << ": " << std::setw(3) << static_cast<int>(ratio * 100.0)
              << "%|" << std::string(filled, '#') << std::string(kBarWidth - filled, ' ') << "| "
              << humanBytes(static_cast<double>(bytes_done)) << "/"
              << humanBytes(static_cast<double>(bytes_total)) << " [" << humanBytes(rate)
              << "/s]" << std::flush;
    drawn_ = true;
}

void ProgressDisplay::ClearProgress() {
    if (drawn_) {
        std::cout << "\r" << std::string(100, ' ') << "\r" << std::flush;
        drawn_ = false;
    }
}

} // namespace reup::cli
