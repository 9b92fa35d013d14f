#include <gtest/gtest.h>
#include "utils/logger.h"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;
using vesta::utils::Logger;

TEST(LoggerTest, LevelFromString) {
    EXPECT_EQ(Logger::levelFromString("TRACE"), Logger::Level::TRACE);
    EXPECT_EQ(Logger::levelFromString("warning"), Logger::Level::WARN);
    EXPECT_EQ(Logger::levelFromString("err"), Logger::Level::ERROR);
    EXPECT_EQ(Logger::levelFromString("bogus"), Logger::Level::INFO);
    EXPECT_STREQ(Logger::levelToString(Logger::Level::CRITICAL), "critical");
}

TEST(LoggerTest, FileSinkReceivesMessages) {
    const std::string path = "./test_logger.log";
    fs::remove(path);

    Logger::init(path, Logger::Level::DEBUG);
    ASSERT_TRUE(Logger::isInitialized());
    VESTA_DEBUG("collection {} has {} documents", "countries", 3);
    VESTA_TRACE("below threshold");
    Logger::shutdown();
    EXPECT_FALSE(Logger::isInitialized());

    std::ifstream ifs(path);
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    EXPECT_NE(buffer.str().find("collection countries has 3 documents"), std::string::npos);
    EXPECT_EQ(buffer.str().find("below threshold"), std::string::npos);

    fs::remove(path);
}

TEST(LoggerTest, MessagesBeforeInitAreDropped) {
    Logger::shutdown();
    VESTA_INFO("no logger yet: {}", 1);
    EXPECT_FALSE(Logger::isInitialized());
}
