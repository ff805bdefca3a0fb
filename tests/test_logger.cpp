#include <catch2/catch.hpp>

#include "logger.hpp"
#include "test_support.hpp"

TEST_CASE("Logger level parsing", "[Logger]")
{
    REQUIRE(Logger::parseLevel("debug") == LogLevel::DEBUG);
    REQUIRE(Logger::parseLevel("INFO") == LogLevel::INFO);
    REQUIRE(Logger::parseLevel("warn") == LogLevel::WARNING);
    REQUIRE(Logger::parseLevel("warning") == LogLevel::WARNING);
    REQUIRE(Logger::parseLevel("3") == LogLevel::ERROR);
    REQUIRE(Logger::parseLevel("none") == LogLevel::NONE);
    REQUIRE_FALSE(Logger::parseLevel("loud"));
    REQUIRE_FALSE(Logger::parseLevel("5"));
    REQUIRE_FALSE(Logger::parseLevel(""));
}

TEST_CASE("Logger output routing", "[Logger]")
{
    SECTION("Levels below the threshold are dropped")
    {
        LogCapture log(LogLevel::WARNING);
        LOG_INFO("quiet");
        LOG_WARNING("loud " << 42);
        REQUIRE(log.out.str() == "[WARN] loud 42\n");
        REQUIRE(log.err.str().empty());
    }

    SECTION("Errors go to the error stream with their location")
    {
        LogCapture log(LogLevel::INFO);
        LOG_ERROR("broken");
        REQUIRE(log.out.str().empty());
        REQUIRE(log.err.str().find("[ERROR] ") == 0);
        REQUIRE(log.err.str().find("test_logger.cpp:") != std::string::npos);
        REQUIRE(log.err.str().find(" - broken\n") != std::string::npos);
    }

    SECTION("NONE silences everything")
    {
        LogCapture log(LogLevel::NONE);
        LOG_ERROR("nothing");
        REQUIRE(log.all().empty());
    }
}
