#ifdef SC_LOG_DEBUG
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace SC {

/**
 * Background stderr logger for the path cache, filtered by tags.
 *
 * Tags in use: "PathBuffer" for copy-on-write reallocations, "Cursor" for
 * mutable cursor growth, "Config" for the options read from the
 * environment, "ERROR" for scratch exhaustion and corrupt views. "Cursor"
 * and "INFO" are skipped unless SUBSCACHE_LOG_CLEAR_DEFAULT_SKIPS is set,
 * since a cursor may reallocate once per iteration step.
 *
 * Output is off unless SUBSCACHE_LOG_ENABLED or SUBSCACHE_LOG is truthy.
 * SUBSCACHE_LOG_ENABLE_TAGS keeps only messages whose tags are all listed;
 * SUBSCACHE_LOG_SKIP_TAGS adds to the skip list.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;

    // Serializes stderr lines with the test runner's progress output.
    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  pending;
    std::mutex              pendingMutex;
    std::condition_variable pendingCv;
    std::thread             writer;
    bool                    stopping = false;
    std::atomic<bool>       enabled{false};
    std::set<std::string>   skipTags{"INFO", "Cursor"};
    std::set<std::string>   onlyTags;

    std::unordered_map<std::thread::id, std::string> threadNames;
    std::mutex                                       threadNamesMutex;

    auto        applyEnvironment() -> void;
    auto        drain() -> void;
    auto        accepts(std::set<std::string> const& tags) const -> bool;
    auto        write(LogMessage const& msg) const -> void;
    auto        threadName() -> std::string;
    static auto shortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!this->enabled.load(std::memory_order_relaxed))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = {std::string(std::forward<Tags>(tags))...},
                                 .message    = message,
                                 .threadName = this->threadName(),
                                 .location   = location};
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->pending.push(std::move(logMessage));
    }
    this->pendingCv.notify_one();
}

#define sc_log(message, ...) ::SC::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace SC

#else
#define sc_log(message, ...) ((void)0)
#endif // SC_LOG_DEBUG
