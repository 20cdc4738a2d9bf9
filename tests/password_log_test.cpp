#include <chrono>
#include <filesystem>
#include <regex>

#include <gtest/gtest.h>

#include "passgen/password_log.hpp"
#include "test_support.hpp"

namespace passgen {
namespace {

using testing::ReadLines;
using testing::TempDir;

const std::regex kLineFormat(R"((Mon|Tue|Wed|Thu|Fri|Sat|Sun) \d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \| (.*))");

TEST(PasswordLogTest, TimestampFormat) {
    const std::string stamp = FilePasswordLog::FormatTimestamp(std::chrono::system_clock::now());
    EXPECT_TRUE(std::regex_match(stamp, std::regex(R"((Mon|Tue|Wed|Thu|Fri|Sat|Sun) \d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2})")))
        << stamp;
}

TEST(PasswordLogTest, CreatesDirectoriesAndAppendsPerMode) {
    TempDir dir;
    FilePasswordLog log(dir.File("nested/logs"));
    const auto now = std::chrono::system_clock::now();

    ASSERT_EQ(log.Append(PasswordMode::Memorable, "Ocean4-River9", now), PassStatus::Ok);
    ASSERT_EQ(log.Append(PasswordMode::Random, "x7#Kp2!q", now), PassStatus::Ok);
    ASSERT_EQ(log.Append(PasswordMode::Memorable, "Stone2-Cloud8", now), PassStatus::Ok);

    EXPECT_TRUE(std::filesystem::is_directory(dir.Path() / "nested/logs/Memorable"));
    EXPECT_TRUE(std::filesystem::is_directory(dir.Path() / "nested/logs/Random"));

    const auto memorable = ReadLines(log.PathFor(PasswordMode::Memorable));
    ASSERT_EQ(memorable.size(), 2U);
    std::smatch match;
    ASSERT_TRUE(std::regex_match(memorable[0], match, kLineFormat)) << memorable[0];
    EXPECT_EQ(match[2].str(), "Ocean4-River9");
    ASSERT_TRUE(std::regex_match(memorable[1], match, kLineFormat)) << memorable[1];
    EXPECT_EQ(match[2].str(), "Stone2-Cloud8");

    const auto random = ReadLines(log.PathFor(PasswordMode::Random));
    ASSERT_EQ(random.size(), 1U);
    ASSERT_TRUE(std::regex_match(random[0], match, kLineFormat)) << random[0];
    EXPECT_EQ(match[2].str(), "x7#Kp2!q");
}

TEST(PasswordLogTest, LogPaths) {
    FilePasswordLog log("root");
    EXPECT_EQ(std::filesystem::path(log.PathFor(PasswordMode::Memorable)),
              std::filesystem::path("root") / "Memorable" / "Generated_Passwords.txt");
    EXPECT_EQ(std::filesystem::path(log.PathFor(PasswordMode::Random)),
              std::filesystem::path("root") / "Random" / "Generated_Passwords.txt");
}

TEST(PasswordLogTest, UnwritableRootIsFileIOError) {
    TempDir dir;
    testing::WriteLines(dir.File("blocker"), {"not a directory"});
    FilePasswordLog log(dir.File("blocker"));
    EXPECT_EQ(log.Append(PasswordMode::Random, "abcd", std::chrono::system_clock::now()), PassStatus::FileIOError);
}

}  // namespace
}  // namespace passgen
