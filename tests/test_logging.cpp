/*
===============================================================================
TEST LOGGING — Tests for logging.h
===============================================================================

OVERVIEW
--------
Validates the process-wide logger: threshold filtering, sink replacement,
default line format, the noexcept guarantee of log() and the ScopedLogLevel
guard.

TEST ORGANIZATION
-----------------
• Section A: Threshold filtering
• Section B: Sinks
• Section C: Format
• Section D: ScopedLogLevel

TEST STRATEGY
-------------
• Every test installs a capturing sink and restores the logger on exit
  (SinkCapture fixture) so tests do not leak configuration into each other

DEPENDENCIES
------------
• Catch2 v3.0+ - Test framework
• logging.h - System under test

===============================================================================
*/

#include <catch2/catch.hpp>
#include <pairgen/logging.h>

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace pairgen;

// ============================================================================
// TEST UTILITIES
// ============================================================================

/**
 * @brief Captures logger output for the lifetime of the fixture
 */
struct SinkCapture {
    std::vector<std::pair<LogLevel, std::string>> lines;
    ScopedLogLevel level{ LogLevel::Trace };

    SinkCapture() {
        logger().setSink([this](LogLevel l, const std::string& m) { lines.emplace_back(l, m); });
    }

    ~SinkCapture() { logger().resetSink(); }
};

// ============================================================================
// SECTION A: THRESHOLD
// ============================================================================

/**
 * @test Threshold::DefaultLevel
 * @brief Verifies the build-dependent default threshold
 */
TEST_CASE("A1: Threshold::DefaultLevel", "[logging][level]")
{
    Logger fresh;
    REQUIRE(fresh.level() == (debug_enabled() ? LogLevel::Debug : LogLevel::Warn));
}

/**
 * @test Threshold::Filtering
 * @brief Verifies messages below the threshold are not dispatched
 */
TEST_CASE("A2: Threshold::Filtering", "[logging][level]")
{
    SinkCapture capture;
    logger().setLevel(LogLevel::Warn);

    logger().debug("hidden");
    logger().info("hidden");
    logger().warn("shown");
    logger().error("shown too");

    REQUIRE(capture.lines.size() == 2);
    REQUIRE(capture.lines[0].first == LogLevel::Warn);
    REQUIRE(capture.lines[0].second == "shown");
    REQUIRE(capture.lines[1].first == LogLevel::Error);
}

/**
 * @test Threshold::EnabledQuery
 * @brief Verifies enabled() and that Off disables everything
 */
TEST_CASE("A3: Threshold::EnabledQuery", "[logging][level]")
{
    SinkCapture capture;

    logger().setLevel(LogLevel::Info);
    REQUIRE(logger().enabled(LogLevel::Info));
    REQUIRE(logger().enabled(LogLevel::Error));
    REQUIRE_FALSE(logger().enabled(LogLevel::Debug));
    REQUIRE_FALSE(logger().enabled(LogLevel::Off));

    logger().setLevel(LogLevel::Off);
    logger().error("dropped");
    logger().log(LogLevel::Off, "never");
    REQUIRE(capture.lines.empty());
}

// ============================================================================
// SECTION B: SINKS
// ============================================================================

/**
 * @test Sinks::ThrowingSinkIsContained
 * @brief Verifies log() does not propagate exceptions from the sink
 */
TEST_CASE("B1: Sinks::ThrowingSinkIsContained", "[logging][sink]")
{
    ScopedLogLevel level(LogLevel::Info);
    logger().setSink([](LogLevel, const std::string&) { throw std::runtime_error("sink down"); });

    REQUIRE_NOTHROW(logger().warn("fallback to stderr"));

    logger().resetSink();
}

/**
 * @test Sinks::ResetRestoresDefault
 * @brief Verifies resetSink() and an empty sink detach the capture
 */
TEST_CASE("B2: Sinks::ResetRestoresDefault", "[logging][sink]")
{
    std::vector<std::string> captured;
    ScopedLogLevel level(LogLevel::Error);

    logger().setSink([&](LogLevel, const std::string& m) { captured.push_back(m); });
    logger().error("first");
    logger().resetSink();
    logger().error("to stderr");

    logger().setSink([&](LogLevel, const std::string& m) { captured.push_back(m); });
    logger().setSink(nullptr);
    logger().error("to stderr again");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured[0] == "first");
}

// ============================================================================
// SECTION C: FORMAT
// ============================================================================

/**
 * @test Format::DefaultLine
 * @brief Verifies "[pairgen] LEVEL: message"
 */
TEST_CASE("C1: Format::DefaultLine", "[logging][format]")
{
    REQUIRE(Logger::format(LogLevel::Warn, "seed dropped") == "[pairgen] WARN: seed dropped");
    REQUIRE(Logger::format(LogLevel::Info, "done") == "[pairgen] INFO: done");
    REQUIRE(Logger::format(LogLevel::Trace, "") == "[pairgen] TRACE: ");
}

// ============================================================================
// SECTION D: SCOPED LEVEL
// ============================================================================

/**
 * @test ScopedLogLevel::RestoresPrevious
 * @brief Verifies the guard restores the previous threshold, also when nested
 */
TEST_CASE("D1: ScopedLogLevel::RestoresPrevious", "[logging][scoped]")
{
    const LogLevel before = logger().level();
    {
        ScopedLogLevel outer(LogLevel::Error);
        REQUIRE(logger().level() == LogLevel::Error);
        {
            ScopedLogLevel inner(LogLevel::Trace);
            REQUIRE(logger().level() == LogLevel::Trace);
        }
        REQUIRE(logger().level() == LogLevel::Error);
    }
    REQUIRE(logger().level() == before);
}
