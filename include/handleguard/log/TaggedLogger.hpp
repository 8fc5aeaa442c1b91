#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <thread>
#include <unordered_map>

namespace HG {

/**
 * Tagged, asynchronous logger. Messages are queued by the caller and written
 * to stderr by a background thread, so logging never re-enters the window
 * runtime and never blocks on I/O from inside a dispatch call.
 *
 * Environment (read at construction):
 * - HANDLEGUARD_LOG / HANDLEGUARD_LOG_ENABLED: enable output.
 * - HANDLEGUARD_LOG_ENABLE_TAGS: only write messages whose tags are all listed.
 * - HANDLEGUARD_LOG_SKIP_TAGS: extra tags to drop.
 * - HANDLEGUARD_LOG_CLEAR_DEFAULT_SKIPS: drop the built-in skip list.
 * - HANDLEGUARD_TRACE_DISPATCH: enable output including the "Dispatch" tag.
 *
 * Messages tagged "Fault" are written even while output is disabled.
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
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    [[nodiscard]] auto isLoggingEnabled() const -> bool;

    // Blocks until every queued message has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::size_t             inFlight = 0;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::set<std::string>   skipTags{"Dispatch", "INFO"};
    std::set<std::string>   enabledTags{};
    std::set<std::string>   alwaysTags{"Fault"};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto processQueue() -> void;
    auto applyEnvironment() -> void;
    auto threadNameFor(std::thread::id id) -> std::string;
    [[nodiscard]] auto forced(const std::set<std::string>& tags) const -> bool;
    [[nodiscard]] auto accepts(const std::set<std::string>& tags) const -> bool;
    auto write(const LogMessage& msg) const -> void;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    std::set<std::string> tagSet{std::string(std::forward<Tags>(tags))...};
    if (!loggingEnabled && !forced(tagSet))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .tags       = std::move(tagSet),
                                 .message    = message,
                                 .threadName = threadNameFor(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        ++this->inFlight;
        this->cv.notify_one();
    }
}

#define hg_log(message, ...) ::HG::logger().log_impl(message, std::source_location::current(), ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);

} // namespace HG
