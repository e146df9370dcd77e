#include <chrono>
#include <core/security/fingerprint.h>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>

using namespace reup::core;
namespace fs = std::filesystem;

namespace {

class FingerprintTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path()
               / (std::string("reup_fingerprint_")
                  + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::create_directories(dir_);
        file_ = dir_ / "image.jpg";
        std::ofstream(file_, std::ios::binary) << "0123456789";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    fs::path file_;
};

} // namespace

TEST_F(FingerprintTest, SameInputsGiveSameId) {
    auto first = Fingerprint::Compute("station", "image.jpg", 10, std::int64_t{1700000000123456789});
    auto second = Fingerprint::Compute("station", "image.jpg", 10, std::int64_t{1700000000123456789});
    EXPECT_EQ(first, second);
}

TEST_F(FingerprintTest, IsLowercaseHexSha256) {
    auto id = Fingerprint::Compute("station", "image.jpg", 10, std::int64_t{42});
    ASSERT_EQ(id.size(), 64u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(FingerprintTest, HashesPipeSeparatedSeed) {
    // sha256("c|f|1|2"), stable across processes and machines
    EXPECT_EQ(Fingerprint::Compute("c", "f", 1, std::int64_t{2}),
              "7e062f8855032d3fa2de14e7b0737b41e12672a8045e2e1f3a54f4c383921b69");
}

TEST_F(FingerprintTest, EveryFieldChangesTheId) {
    auto base = Fingerprint::Compute("station", "image.jpg", 10, std::int64_t{42});
    EXPECT_NE(base, Fingerprint::Compute("other", "image.jpg", 10, std::int64_t{42}));
    EXPECT_NE(base, Fingerprint::Compute("station", "image.png", 10, std::int64_t{42}));
    EXPECT_NE(base, Fingerprint::Compute("station", "image.jpg", 11, std::int64_t{42}));
    EXPECT_NE(base, Fingerprint::Compute("station", "image.jpg", 10, std::int64_t{43}));
}

TEST_F(FingerprintTest, PathOverloadUsesModificationTime) {
    auto mtime = Fingerprint::ModificationTimeNs(file_);
    EXPECT_GT(mtime, 0);
    EXPECT_EQ(Fingerprint::Compute("station", "image.jpg", 10, file_),
              Fingerprint::Compute("station", "image.jpg", 10, mtime));
}

TEST_F(FingerprintTest, RepeatedCallsOnUnchangedFileAgree) {
    auto first = Fingerprint::Compute("station", "image.jpg", 10, file_);
    auto second = Fingerprint::Compute("station", "image.jpg", 10, file_);
    EXPECT_EQ(first, second);
}

TEST_F(FingerprintTest, TouchingTheFileChangesTheId) {
    auto before = Fingerprint::Compute("station", "image.jpg", 10, file_);
    fs::last_write_time(file_, fs::last_write_time(file_) + std::chrono::seconds(5));
    EXPECT_NE(before, Fingerprint::Compute("station", "image.jpg", 10, file_));
}

TEST_F(FingerprintTest, MissingFileThrows) {
    EXPECT_THROW(Fingerprint::Compute("station", "none", 0, dir_ / "none"),
                 fs::filesystem_error);
}
