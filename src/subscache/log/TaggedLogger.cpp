#ifdef SC_LOG_DEBUG
#include "TaggedLogger.hpp"

#include "utils/Environment.hpp"

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SC {

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() {
    this->applyEnvironment();
    this->writer = std::thread(&TaggedLogger::drain, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->pendingMutex);
        this->stopping = true;
    }
    this->pendingCv.notify_one();
    if (this->writer.joinable()) {
        this->writer.join();
    }
}

auto TaggedLogger::applyEnvironment() -> void {
    if (env_truthy("SUBSCACHE_LOG_ENABLED") || env_truthy("SUBSCACHE_LOG")) {
        this->enabled.store(true, std::memory_order_relaxed);
    }
    if (env_truthy("SUBSCACHE_LOG_CLEAR_DEFAULT_SKIPS")) {
        this->skipTags.clear();
    }
    for (auto& tag : env_list("SUBSCACHE_LOG_SKIP_TAGS")) {
        this->skipTags.insert(std::move(tag));
    }
    for (auto& tag : env_list("SUBSCACHE_LOG_ENABLE_TAGS")) {
        this->onlyTags.insert(std::move(tag));
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::setLoggingEnabled(bool value) -> void {
    this->enabled.store(value, std::memory_order_relaxed);
}

// Writes queued messages until the destructor asks to stop and the queue is empty.
auto TaggedLogger::drain() -> void {
    std::unique_lock<std::mutex> lock(this->pendingMutex);
    while (true) {
        this->pendingCv.wait(lock, [this] { return !this->pending.empty() || this->stopping; });
        while (!this->pending.empty()) {
            auto msg = std::move(this->pending.front());
            this->pending.pop();
            lock.unlock();
            this->write(msg);
            lock.lock();
        }
        if (this->stopping) {
            return;
        }
    }
}

auto TaggedLogger::accepts(std::set<std::string> const& tags) const -> bool {
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag))
            return false;
        if (!this->onlyTags.empty() && !this->onlyTags.contains(tag))
            return false;
    }
    return true;
}

auto TaggedLogger::shortPath(const char* filepath) -> std::string {
    std::filesystem::path path{filepath};
    if (path.has_parent_path()) {
        return (path.parent_path().filename() / path.filename()).string();
    }
    return path.filename().string();
}

auto TaggedLogger::write(LogMessage const& msg) const -> void {
    if (!this->accepts(msg.tags))
        return;

    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const when   = std::chrono::system_clock::to_time_t(msg.timestamp);

    std::ostringstream line;
    line << std::put_time(std::localtime(&when), "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
         << millis.count() << ' ';
    for (auto const& tag : msg.tags) {
        line << '[' << tag << ']';
    }
    line << " [" << msg.threadName << "] [" << shortPath(msg.location.file_name()) << ':' << msg.location.line()
         << "] " << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line.str() << std::flush;
}

auto TaggedLogger::threadName() -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(std::this_thread::get_id());
    if (inserted) {
        it->second = "Thread " + std::to_string(this->threadNames.size() - 1);
    }
    return it->second;
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace SC
#endif // SC_LOG_DEBUG
