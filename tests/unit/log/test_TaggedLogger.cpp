#ifdef SC_LOG_DEBUG
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"
#include "support/EnvGuard.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

using namespace std::chrono_literals;
using SC::testing::EnvBlock;
using SC::testing::EnvGuard;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

void waitForFlush() {
    std::this_thread::sleep_for(20ms);
}

auto makeBaselineEnvBlock() -> EnvBlock {
    return EnvBlock{
        {"SUBSCACHE_LOG_ENABLED", nullptr},
        {"SUBSCACHE_LOG", nullptr},
        {"SUBSCACHE_LOG_CLEAR_DEFAULT_SKIPS", nullptr},
        {"SUBSCACHE_LOG_ENABLE_TAGS", nullptr},
        {"SUBSCACHE_LOG_SKIP_TAGS", nullptr},
    };
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("logging_disabled_by_default_drops_messages") {
    auto env = makeBaselineEnvBlock();

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "PathBuffer");
        waitForFlush();
    });

    CHECK(output.empty());
}

TEST_CASE("environment_flag_enables_logging") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG_ENABLED", "1");

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("reallocated ^hello", std::source_location::current(), "PathBuffer");
        waitForFlush();
    });

    CHECK(output.find("[PathBuffer]") != std::string::npos);
    CHECK(output.find("reallocated ^hello") != std::string::npos);
    CHECK(output.find("Thread 0") != std::string::npos);
    CHECK(output.find("test_TaggedLogger.cpp") != std::string::npos);
}

TEST_CASE("SUBSCACHE_LOG_env_enables_logging") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG", "on");

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("env enabled", std::source_location::current(), "EnvTag");
        waitForFlush();
    });

    CHECK(output.find("env enabled") != std::string::npos);
}

TEST_CASE("default_skip_list_filters_cursor_tag") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG_ENABLED", "1");

    auto skipped = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("filtered", std::source_location::current(), "PathBuffer", "Cursor");
        waitForFlush();
    });

    CHECK(skipped.empty());
}

TEST_CASE("clear_default_skips_allows_info") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG_ENABLED", "1");
    EnvGuard clearSkips("SUBSCACHE_LOG_CLEAR_DEFAULT_SKIPS", "1");

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("info allowed", std::source_location::current(), "INFO");
        waitForFlush();
    });

    CHECK(output.find("info allowed") != std::string::npos);
}

TEST_CASE("skip_tags_from_environment") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG_ENABLED", "1");
    EnvGuard skip("SUBSCACHE_LOG_SKIP_TAGS", "Config, Noise");

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("noisy", std::source_location::current(), "Noise");
        logger.log_impl("kept", std::source_location::current(), "PathBuffer");
        waitForFlush();
    });

    CHECK(output.find("noisy") == std::string::npos);
    CHECK(output.find("kept") != std::string::npos);
}

TEST_CASE("enabled_tags_gate_output") {
    auto     env = makeBaselineEnvBlock();
    EnvGuard enableLog("SUBSCACHE_LOG_ENABLED", "1");
    EnvGuard enableTags("SUBSCACHE_LOG_ENABLE_TAGS", "Focus");

    auto accepted = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("keep me", std::source_location::current(), "Focus");
        waitForFlush();
    });
    CHECK(accepted.find("keep me") != std::string::npos);

    auto rejected = captureStderr([] {
        SC::TaggedLogger logger;
        logger.log_impl("drop me", std::source_location::current(), "Focus", "Other");
        waitForFlush();
    });
    CHECK(rejected.empty());
}

TEST_CASE("runtime_toggle_and_thread_names") {
    auto env = makeBaselineEnvBlock();

    auto output = captureStderr([] {
        SC::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Walker");
        logger.log_impl("named", std::source_location::current(), "PathBuffer");
        waitForFlush();
    });

    CHECK(output.find("[Walker]") != std::string::npos);
}

}
#endif // SC_LOG_DEBUG
