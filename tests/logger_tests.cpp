#include "gtest/gtest.h"
#include "test_helpers.h"
#include "utilities/logger.h"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> readLines(const fs::path& path) {
    std::vector<std::string> lines;
    std::istringstream in(readFileContents(path));
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

} // namespace

// Test fixture for Logger tests
class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = makeScratchDir("logger");
        logFile_ = (dir_ / "test.log").string();
    }

    void TearDown() override {
        // Point the singleton back at the suite log so the scratch files are released.
        Logger::init(g_testLogFile, LogLevel::DEBUG);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path dir_;
    std::string logFile_;
};

TEST_F(LoggerTest, WritesOneJsonObjectPerLine) {
    Logger::init(logFile_, LogLevel::DEBUG);
    Logger::getInstance().log(LogLevel::INFO, "upload finalized");
    Logger::getInstance().log(LogLevel::ERROR, "chunk write failed: \"quoted\"");

    auto lines = readLines(logFile_);
    ASSERT_EQ(lines.size(), 2u);
    auto first = nlohmann::json::parse(lines[0]);
    EXPECT_EQ(first.at("level"), "INFO");
    EXPECT_EQ(first.at("message"), "upload finalized");
    const std::string ts = first.at("timestamp");
    EXPECT_EQ(ts.size(), 20u);
    EXPECT_EQ(ts.back(), 'Z');
    EXPECT_EQ(ts[10], 'T');

    auto second = nlohmann::json::parse(lines[1]);
    EXPECT_EQ(second.at("level"), "ERROR");
    EXPECT_EQ(second.at("message"), "chunk write failed: \"quoted\"");
}

TEST_F(LoggerTest, FiltersBelowConfiguredLevel) {
    Logger::init(logFile_, LogLevel::WARN);
    Logger::getInstance().log(LogLevel::DEBUG, "hidden debug");
    Logger::getInstance().log(LogLevel::INFO, "hidden info");
    Logger::getInstance().log(LogLevel::WARN, "shown warn");
    Logger::getInstance().log(LogLevel::FATAL, "shown fatal");

    auto lines = readLines(logFile_);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(nlohmann::json::parse(lines[0]).at("message"), "shown warn");
    EXPECT_EQ(nlohmann::json::parse(lines[1]).at("level"), "FATAL");

    Logger::getInstance().setLogLevel(LogLevel::TRACE);
    EXPECT_EQ(Logger::getInstance().getLogLevel(), LogLevel::TRACE);
    Logger::getInstance().log(LogLevel::TRACE, "quality image_quality=75");
    lines = readLines(logFile_);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(nlohmann::json::parse(lines[2]).at("level"), "TRACE");
}

TEST_F(LoggerTest, RotatesKeepingConfiguredBackups) {
    Logger::init(logFile_, LogLevel::INFO, 200, 2);
    const std::string padding(100, 'x');
    for (int i = 0; i < 12; ++i) {
        Logger::getInstance().log(LogLevel::INFO, "record " + std::to_string(i) + " " + padding);
    }
    EXPECT_TRUE(fs::exists(logFile_));
    EXPECT_TRUE(fs::exists(logFile_ + ".1"));
    EXPECT_TRUE(fs::exists(logFile_ + ".2"));
    EXPECT_FALSE(fs::exists(logFile_ + ".3"));

    // The newest record is in the active file.
    auto lines = readLines(logFile_);
    ASSERT_FALSE(lines.empty());
    const std::string last = nlohmann::json::parse(lines.back()).at("message");
    EXPECT_EQ(last.rfind("record 11 ", 0), 0u);
}

TEST_F(LoggerTest, RotationWithoutBackupsTruncates) {
    Logger::init(logFile_, LogLevel::INFO, 200, 0);
    const std::string padding(100, 'y');
    for (int i = 0; i < 6; ++i) {
        Logger::getInstance().log(LogLevel::INFO, "entry " + std::to_string(i) + " " + padding);
    }
    EXPECT_FALSE(fs::exists(logFile_ + ".1"));
    EXPECT_LE(readLines(logFile_).size(), 2u);
}

TEST_F(LoggerTest, ReinitSwitchesTarget) {
    const std::string other = (dir_ / "other.log").string();
    Logger::init(logFile_, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "to first");
    Logger::init(other, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "to second");

    auto first = readLines(logFile_);
    auto second = readLines(other);
    ASSERT_EQ(first.size(), 1u);
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(nlohmann::json::parse(second[0]).at("message"), "to second");
}

TEST_F(LoggerTest, CreatesMissingParentDirectory) {
    const std::string nested = (dir_ / "a" / "b" / "nested.log").string();
    Logger::init(nested, LogLevel::INFO);
    Logger::getInstance().log(LogLevel::INFO, "hello");
    EXPECT_EQ(readLines(nested).size(), 1u);
}

TEST(LoggerLevels, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(Logger::levelFromString("trace"), LogLevel::TRACE);
    EXPECT_EQ(Logger::levelFromString("DEBUG"), LogLevel::DEBUG);
    EXPECT_EQ(Logger::levelFromString("Info"), LogLevel::INFO);
    EXPECT_EQ(Logger::levelFromString("warning"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("warn"), LogLevel::WARN);
    EXPECT_EQ(Logger::levelFromString("error"), LogLevel::ERROR);
    EXPECT_EQ(Logger::levelFromString("fatal"), LogLevel::FATAL);
    EXPECT_EQ(Logger::levelFromString("verbose"), LogLevel::INFO);
}
