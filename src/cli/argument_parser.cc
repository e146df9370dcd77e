#include <algorithm>
#include <cli/argument_parser.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

ArgumentParser::ArgumentParser(int argc, char* argv[])
    : argc_(argc)
    , argv_(argv)
    , i(1) {}

CliOptions ArgumentParser::Parse() {
    CliOptions options;

    while (i < argc_) {
        std::string arg = argv_[i];

        if (arg.empty() || arg[0] != '-') {
            // 第一个非选项参数是要上传的文件
            if (!options.file_path.empty()) {
                throw std::runtime_error("Only one file can be uploaded at a time: " + arg);
            }
            options.file_path = arg;
        } else {
            parseOptions(arg, options);
        }
        i++;
    }

    if (!validateOptions(options)) {
        ShowHelp();
        std::exit(1);
    }

    return options;
}

std::string ArgumentParser::nextValue(const char* missing) {
    if (++i >= argc_) {
        throw std::runtime_error(missing);
    }
    return argv_[i];
}

void ArgumentParser::parseOptions(const std::string& arg, CliOptions& options) {
    if (arg == "-H" || arg == "--host") {
        options.host = nextValue("Missing server host");
    } else if (arg == "-p" || arg == "--port") {
        int port = std::stoi(nextValue("Missing port number"));
        if (port <= 0 || port > 65535) {
            throw std::runtime_error("Port must be between 1 and 65535");
        }
        options.port = static_cast<uint16_t>(port);
    } else if (arg == "-n" || arg == "--client-name") {
        options.client_name = nextValue("Missing client name");
    } else if (arg == "-c" || arg == "--config") {
        options.config_path = nextValue("Missing config path");
    } else if (arg == "-r" || arg == "--max-retries") {
        long retries = std::stol(nextValue("Missing retry count"));
        if (retries < 0) {
            throw std::runtime_error("Retry count must not be negative");
        }
        options.max_retries = static_cast<uint32_t>(retries);
    } else if (arg == "-l" || arg == "--log-level") {
        options.log_level = nextValue("Missing log level");
    } else if (arg == "-q" || arg == "--quiet") {
        options.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
        ShowHelp();
        std::exit(0);
    } else {
        throw std::runtime_error("Unknown option: " + arg);
    }
}

bool ArgumentParser::validateOptions(const CliOptions& options) {
    if (options.file_path.empty()) {
        std::cerr << "Error: No file given" << std::endl;
        return false;
    }

    if (options.client_name && options.client_name->empty()) {
        std::cerr << "Error: Client name must not be empty" << std::endl;
        return false;
    }

    if (options.log_level) {
        std::string level = *options.log_level;
        std::transform(level.begin(), level.end(), level.begin(), ::tolower);
        if (level != "trace" && level != "debug" && level != "info" && level != "warning"
            && level != "error") {
            std::cerr << "Error: Invalid log level" << std::endl;
            return false;
        }
    }

    return true;
}

void ArgumentParser::ShowHelp() {
    std::cout << "Usage: reup [options] FILE\n\n"
              << "Upload FILE to the server, resuming where a previous attempt stopped.\n\n"
              << "Options:\n"
              << "  -H, --host HOST         Server host (default: from config)\n"
              << "  -p, --port PORT         Server port (default: from config)\n"
              << "  -n, --client-name NAME  Client identity sent to the server\n"
              << "  -c, --config PATH       Config file path\n"
              << "  -r, --max-retries N     Connection attempts before giving up, 0 = forever\n"
              << "  -l, --log-level LVL     Log level (trace|debug|info|warning|error)\n"
              << "  -q, --quiet             Do not draw the progress bar\n"
              << "  -h, --help              Show this help message\n";
}
