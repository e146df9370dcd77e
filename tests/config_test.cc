#include <core/util/config.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace reup::core;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path()
               / (std::string("reup_config_")
                  + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        path_ = dir_ / "config.toml";
        settings = Settings{};
        config = toml::table{};
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void writeConfig(const std::string& text) {
        fs::create_directories(dir_);
        std::ofstream(path_) << text;
    }

    fs::path dir_;
    fs::path path_;
};

} // namespace

TEST_F(ConfigTest, MissingFileIsCreatedWithDefaults) {
    InitConfig(path_);
    EXPECT_TRUE(fs::exists(path_));
    EXPECT_EQ(settings.host, "127.0.0.1");
    EXPECT_EQ(settings.port, 8888);
    EXPECT_EQ(settings.chunk_size, 4u * 1024 * 1024);
    EXPECT_EQ(settings.write_buffer_high, 32u * 1024 * 1024);
    EXPECT_EQ(settings.write_buffer_low, 8u * 1024 * 1024);
    EXPECT_EQ(settings.connect_timeout, 10s);
    EXPECT_EQ(settings.offset_timeout, 120s);
    EXPECT_EQ(settings.max_retries, 0u);
    EXPECT_EQ(settings.retry_delay, 2s);
    EXPECT_EQ(settings.retry_backoff, RetryBackoff::kFixed);
}

TEST_F(ConfigTest, ReadsUploadTable) {
    writeConfig(R"(
[upload]
host = "10.1.2.3"
port = 9000
client-name = "station-7"
chunk-size = 1048576
connect-timeout = 1.5
drain-timeout = 5
max-retries = 3
retry-delay = 0.25
retry-backoff = "exponential"
)");
    InitConfig(path_);
    EXPECT_EQ(settings.host, "10.1.2.3");
    EXPECT_EQ(settings.port, 9000);
    EXPECT_EQ(settings.client_name, "station-7");
    EXPECT_EQ(settings.chunk_size, 1048576u);
    EXPECT_EQ(settings.connect_timeout, 1500ms);
    EXPECT_EQ(settings.drain_timeout, 5s);
    EXPECT_EQ(settings.max_retries, 3u);
    EXPECT_EQ(settings.retry_delay, 250ms);
    EXPECT_EQ(settings.retry_backoff, RetryBackoff::kExponential);
}

TEST_F(ConfigTest, InvalidValuesFallBackToDefaults) {
    writeConfig(R"(
[upload]
port = 70000
chunk-size = -1
write-buffer-high = 1024
write-buffer-low = 4096
max-retries = -5
retry-backoff = "sometimes"
)");
    InitConfig(path_);
    EXPECT_EQ(settings.port, 8888);
    EXPECT_EQ(settings.chunk_size, 4u * 1024 * 1024);
    EXPECT_EQ(settings.write_buffer_high, 1024u);
    EXPECT_EQ(settings.write_buffer_low, 1024u);
    EXPECT_EQ(settings.max_retries, 0u);
    EXPECT_EQ(settings.retry_backoff, RetryBackoff::kFixed);
}

TEST_F(ConfigTest, UnparsableFileKeepsDefaults) {
    writeConfig("[upload\nhost = ");
    InitConfig(path_);
    EXPECT_EQ(settings.host, "127.0.0.1");
}

TEST_F(ConfigTest, SaveThenLoadKeepsValues) {
    InitConfig(path_);
    settings.host = "example.org";
    settings.max_retries = 9;
    settings.response_timeout = 45s;
    SaveConfig(path_);

    settings = Settings{};
    InitConfig(path_);
    EXPECT_EQ(settings.host, "example.org");
    EXPECT_EQ(settings.max_retries, 9u);
    EXPECT_EQ(settings.response_timeout, 45s);
}

TEST_F(ConfigTest, OutOfRangeDurationsAndRetriesFallBack) {
    writeConfig(R"(
[upload]
connect-timeout = 1e300
offset-timeout = inf
retry-delay = nan
drain-timeout = -1.0
response-timeout = 12.5
max-retries = 5000000000
)");
    InitConfig(path_);
    EXPECT_EQ(settings.connect_timeout, 10s);
    EXPECT_EQ(settings.offset_timeout, 120s);
    EXPECT_EQ(settings.retry_delay, 2s);
    EXPECT_EQ(settings.drain_timeout, 30s);
    EXPECT_EQ(settings.response_timeout, 12500ms);
    EXPECT_EQ(settings.max_retries, 0u);
}
