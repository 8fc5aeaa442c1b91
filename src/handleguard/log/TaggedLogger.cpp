#include <handleguard/log/TaggedLogger.hpp>

#include <handleguard/config/Flags.hpp>

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>
#include <utility>

namespace HG {
namespace {

// "dir/File.cpp" out of a full path.
auto short_source(std::string_view path) -> std::string_view {
    auto const last = path.find_last_of("/\\");
    if (last == std::string_view::npos || last == 0) {
        return path;
    }
    auto const previous = path.find_last_of("/\\", last - 1);
    return previous == std::string_view::npos ? path : path.substr(previous + 1);
}

auto format_line(TaggedLogger::LogMessage const& msg) -> std::string {
    auto const millis = std::chrono::duration_cast<std::chrono::milliseconds>(msg.timestamp.time_since_epoch()) % 1000;
    auto const when   = std::chrono::system_clock::to_time_t(msg.timestamp);
    std::tm    local{};
    localtime_r(&when, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    oss << '[';
    bool first = true;
    for (auto const& tag : msg.tags) {
        oss << (first ? "" : "][") << tag;
        first = false;
    }
    oss << "] [" << msg.threadName << "] [" << short_source(msg.location.file_name()) << ':' << msg.location.line() << "] "
        << msg.message << '\n';
    return oss.str();
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(Config::LoggingRequested()), nextThreadNumber(0) {
    this->applyEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::lock_guard<std::mutex> lock(this->queueMutex);
        this->running = false;
    }
    this->cv.notify_one();
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::applyEnvironment() -> void {
    if (Config::EnvFlag("HANDLEGUARD_LOG_CLEAR_DEFAULT_SKIPS")) {
        this->skipTags.clear();
    }
    for (auto& tag : Config::EnvList("HANDLEGUARD_LOG_SKIP_TAGS")) {
        this->skipTags.insert(std::move(tag));
    }
    for (auto& tag : Config::EnvList("HANDLEGUARD_LOG_ENABLE_TAGS")) {
        this->enabledTags.insert(std::move(tag));
    }
    // Tracing is pointless while its own tag is filtered out.
    if (Config::DispatchTraceEnabled()) {
        this->skipTags.erase("Dispatch");
        this->loggingEnabled = true;
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    this->threadNames[std::this_thread::get_id()] = name;
}

auto TaggedLogger::threadNameFor(std::thread::id id) -> std::string {
    std::lock_guard<std::mutex> lock(this->threadNamesMutex);
    auto [it, inserted] = this->threadNames.try_emplace(id);
    if (inserted) {
        it->second = "Thread " + std::to_string(this->nextThreadNumber++);
    }
    return it->second;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    this->loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return this->loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->inFlight == 0; });
}

auto TaggedLogger::forced(const std::set<std::string>& tags) const -> bool {
    for (auto const& tag : tags) {
        if (this->alwaysTags.contains(tag)) {
            return true;
        }
    }
    return false;
}

auto TaggedLogger::accepts(const std::set<std::string>& tags) const -> bool {
    if (this->forced(tags)) {
        return true;
    }
    for (auto const& tag : tags) {
        if (this->skipTags.contains(tag)) {
            return false;
        }
        if (!this->enabledTags.empty() && !this->enabledTags.contains(tag)) {
            return false;
        }
    }
    return true;
}

auto TaggedLogger::write(const LogMessage& msg) const -> void {
    if (!this->accepts(msg.tags)) {
        return;
    }
    auto const line = format_line(msg);
    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
}

auto TaggedLogger::processQueue() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    while (true) {
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });
        if (this->messageQueue.empty()) {
            return;
        }
        // Written outside the lock so callers never wait on stderr.
        std::queue<LogMessage> batch;
        batch.swap(this->messageQueue);
        lock.unlock();
        auto const written = batch.size();
        for (; !batch.empty(); batch.pop()) {
            this->write(batch.front());
        }
        lock.lock();
        this->inFlight -= written;
        this->drained.notify_all();
    }
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace HG
