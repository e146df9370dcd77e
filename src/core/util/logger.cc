#include <chrono>
#include <core/util/logger.h>
#include <cstdio>
#include <ctime>
#include <spdlog/sinks/daily_file_sink.h>
#include <system_error>

namespace reup {

namespace {

void stampLogFile(const char* tag, const spdlog::filename_t& filename, std::FILE* fstream) {
    if (fstream) {
        auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::fprintf(fstream, "[%s: %s | %s]\n", tag, filename.c_str(), std::ctime(&now));
    }
}

} // namespace

Logger::Logger(Level level,
               const std::filesystem::path& log_dir,
               std::uint16_t max_files,
               std::size_t q_max_items) {
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);

    spdlog::file_event_handlers handlers;
    handlers.after_open = [](const spdlog::filename_t& filename, std::FILE* fstream) {
        stampLogFile("Log Start", filename, fstream);
    };
    handlers.before_close = [](const spdlog::filename_t& filename, std::FILE* fstream) {
        stampLogFile("Log End", filename, fstream);
    };

    // rotates at midnight
    auto file_sink = std::make_shared<spdlog::sinks::daily_file_sink_mt>((log_dir / "reup.log")
                                                                             .string(),
                                                                         0,
                                                                         0,
                                                                         false,
                                                                         max_files,
                                                                         handlers);
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_pattern("\033[36m[%H:%M:%S.%e] \033[0m%^[%l]%$ %v");
#ifdef REUP_RELEASE
    console_sink_->set_level(Level::warn);
#endif

    thread_pool_ = std::make_shared<spdlog::details::thread_pool>(q_max_items, 1);
    logger_ = std::make_shared<spdlog::async_logger>("reup",
                                                     spdlog::sinks_init_list{file_sink,
                                                                             console_sink_},
                                                     thread_pool_,
                                                     spdlog::async_overflow_policy::block);
    logger_->set_level(level);
    logger_->flush_on(Level::warn);
    logger_->set_error_handler([](const std::string& msg) {
        std::fprintf(stderr, "*** LOGGER ERROR ***: %s\n", msg.c_str());
    });

    spdlog::set_default_logger(logger_);
}

Logger::~Logger() {
    logger_->flush();
    spdlog::shutdown();
}

} // namespace reup
