#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct CliOptions {
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::string> client_name;
    std::optional<std::string> config_path;
    std::optional<uint32_t> max_retries;
    std::optional<std::string> log_level;
    bool quiet = false;
    std::string file_path;
};

class ArgumentParser {
public:
    ArgumentParser(int argc, char* argv[]);

    // 解析命令行参数
    CliOptions Parse();

    // 显示帮助信息
    void ShowHelp();

private:
    int argc_;
    char** argv_;
    int i; // 当前解析的参数索引

    // 参数解析
    void parseOptions(const std::string& arg, CliOptions& options);
    std::string nextValue(const char* missing);

    // 参数验证
    bool validateOptions(const CliOptions& options);
};
