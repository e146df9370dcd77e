#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <spdlog/async_logger.h>
#include <spdlog/details/thread_pool.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace reup {

// Process-wide logging. Installs an async spdlog logger named "reup" as the default
// logger, writing to a daily file under `log_dir` and to stderr. stdout stays free for
// the progress bar.
class Logger {
public:
    using Level = spdlog::level::level_enum;

    Logger(Level level,
           const std::filesystem::path& log_dir,
           std::uint16_t max_files = 7,
           std::size_t q_max_items = 8192);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    auto& logger() { return logger_; }
    [[nodiscard]] Level logLevel() const { return logger_->level(); }
    void set_log_level(Level level) { logger_->set_level(level); }
    void set_console_level(Level level) { console_sink_->set_level(level); }

    void Flush() { logger_->flush(); }

private:
    std::shared_ptr<spdlog::details::thread_pool> thread_pool_;
    std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    std::shared_ptr<spdlog::async_logger> logger_;
};

} // namespace reup
