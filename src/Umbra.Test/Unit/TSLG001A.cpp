// TSLG001A.cpp - Logger Tests
// Tests for IRLG001A Logger
// Verifies: level filtering, file sink, concurrent writers.

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include <IRLG001A.h>

namespace umbra::test {

using namespace Umbra;
namespace fs = std::filesystem;

class LoggerTests : public ::testing::Test {
protected:
    void SetUp() override {
        logPath = fs::temp_directory_path() / "umbra_logger_test.log";
        std::error_code ec;
        fs::remove(logPath, ec);
        Logger::instance().setColourEnabled(false);
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.setLogFile("");
        logger.setLevel(LogLevel::Info);
        logger.setColourEnabled(true);
        std::error_code ec;
        fs::remove(logPath, ec);
    }

    std::string readLog() const {
        std::ifstream in(logPath);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fs::path logPath;
};

TEST_F(LoggerTests, LevelFiltersMessages) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::Warning);

    EXPECT_EQ(logger.level(), LogLevel::Warning);
    EXPECT_FALSE(logger.isEnabled(LogLevel::Debug));
    EXPECT_FALSE(logger.isEnabled(LogLevel::Info));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Warning));
    EXPECT_TRUE(logger.isEnabled(LogLevel::Fatal));
}

TEST_F(LoggerTests, FileSinkReceivesEnabledMessages) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::Info);
    ASSERT_TRUE(logger.setLogFile(logPath.string()));

    LOG_DEBUG("hidden debug line");
    LOG_INFO("[Beam] visible info line");
    LOG_ERROR("visible error line");
    logger.setLogFile("");

    const std::string text = readLog();
    EXPECT_EQ(text.find("hidden debug line"), std::string::npos);
    EXPECT_NE(text.find("[INFO ] [Beam] visible info line"), std::string::npos);
    EXPECT_NE(text.find("[ERROR] visible error line"), std::string::npos);
}

TEST_F(LoggerTests, UnwritableFileRejected) {
    EXPECT_FALSE(Logger::instance().setLogFile("/nonexistent-umbra-dir/sub/log.txt"));
}

TEST_F(LoggerTests, ConcurrentWritersProduceWholeLines) {
    auto& logger = Logger::instance();
    logger.setLevel(LogLevel::Info);
    ASSERT_TRUE(logger.setLogFile(logPath.string()));

    constexpr int kThreads = 4;
    constexpr int kLines = 50;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < kLines; ++i) {
                LOG_INFO("worker " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    logger.setLogFile("");

    std::istringstream in(readLog());
    std::string line;
    int count = 0;
    while (std::getline(in, line)) {
        EXPECT_NE(line.find("[INFO ] worker "), std::string::npos) << line;
        ++count;
    }
    EXPECT_EQ(count, kThreads * kLines);
}

} // namespace umbra::test
