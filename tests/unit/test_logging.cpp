#include <gtest/gtest.h>
#include "utils/logger.hpp"
#include <cstdio>
#include <string>

TEST(LoggerTest, InfoLevelWorks) {
    ingen::Logger& log = ingen::Logger::get();
    log.set_level(ingen::LogLevel::INFO);
    log.info("Test info message: %d", 42);
    EXPECT_EQ(log.get_level(), ingen::LogLevel::INFO);
}

TEST(LoggerTest, LevelFiltersLowerMessages) {
    std::FILE* tmp = std::tmpfile();
    ASSERT_NE(tmp, nullptr);

    ingen::Logger& log = ingen::Logger::get();
    log.set_stream(tmp);
    log.set_colors(false);
    log.set_level(ingen::LogLevel::WARN);
    log.info("hidden");
    log.warn("shown %s", "warning");
    log.flush();

    std::rewind(tmp);
    char buf[256] = {0};
    std::string contents;
    while (std::fgets(buf, sizeof(buf), tmp)) {
        contents += buf;
    }

    log.set_stream(stderr);
    log.set_level(ingen::LogLevel::INFO);
    log.set_colors(true);
    std::fclose(tmp);

    EXPECT_EQ(contents.find("hidden"), std::string::npos);
    EXPECT_NE(contents.find("WARN: shown warning"), std::string::npos);
}

TEST(LoggerTest, LevelFromIntClamps) {
    EXPECT_EQ(ingen::log_level_from_int(-3), ingen::LogLevel::TRACE);
    EXPECT_EQ(ingen::log_level_from_int(1), ingen::LogLevel::DEBUG);
    EXPECT_EQ(ingen::log_level_from_int(9), ingen::LogLevel::ERROR);
}
