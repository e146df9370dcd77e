#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <cli/argument_parser.h>
#include <cli/progress_display.h>
#include <core/constant/path.h>
#include <core/model.h>
#include <core/network/client/upload_session.h>
#include <core/util/config.h>
#include <core/util/logger.h>
#include <core/util/retry_policy.h>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>

using namespace reup;
using namespace reup::core;
namespace net = boost::asio;

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        options = ArgumentParser(argc, argv).Parse();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    Logger logger(
#ifdef REUP_DEBUG
        Logger::Level::debug,
#else
        Logger::Level::info,
#endif
        path::kLogDir);
    if (options.log_level) {
        logger.set_log_level(spdlog::level::from_str(*options.log_level));
    }

    InitConfig(options.config_path ? std::filesystem::path(*options.config_path)
                                   : path::kDefaultConfigFile);
    if (options.host) {
        settings.host = *options.host;
    }
    if (options.port) {
        settings.port = *options.port;
    }
    if (options.client_name) {
        settings.client_name = *options.client_name;
    }
    if (options.max_retries) {
        settings.max_retries = *options.max_retries;
    }

    std::filesystem::path file_path(options.file_path);
    cli::ProgressDisplay display(file_path.filename().string());
    if (!options.quiet) {
        logger.set_console_level(Logger::Level::warn);
    }

    net::io_context ioc;
    UploadSession session(ioc,
                          settings,
                          RetryPolicy::FromSettings(settings),
                          options.quiet ? nullptr : &display,
                          [](Feedback&& feedback) {
                              spdlog::debug("feedback: {}", nlohmann::json(feedback).dump());
                          });

    net::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&session](const boost::system::error_code& ec, int signal) {
        if (!ec) {
            spdlog::warn("Received signal {}, stopping upload", signal);
            session.Cancel();
        }
    });

    std::optional<TransferOutcome> outcome;
    net::co_spawn(ioc,
                  session.Upload(file_path),
                  [&](std::exception_ptr error, TransferOutcome result) {
                      signals.cancel();
                      if (error) {
                          try {
                              std::rethrow_exception(error);
                          } catch (const std::exception& e) {
                              spdlog::error("Upload aborted: {}", e.what());
                          }
                          return;
                      }
                      outcome = std::move(result);
                  });

    spdlog::info("reup started, uploading {} to {}:{}",
                 file_path.string(),
                 settings.host,
                 settings.port);
    ioc.run();
    display.ClearProgress();

    if (!outcome) {
        return 1;
    }
    if (outcome->success()) {
        spdlog::info("Upload of {} completed after {} attempt(s)",
                     file_path.filename().string(),
                     outcome->attempts);
        std::cout << "Uploaded " << file_path.filename().string() << std::endl;
    } else {
        spdlog::error("Upload of {} failed: {}",
                      file_path.filename().string(),
                      nlohmann::json(*outcome).dump());
        std::cerr << "Upload failed: " << outcome->reason << std::endl;
    }
    return outcome->success() ? 0 : 1;
}
