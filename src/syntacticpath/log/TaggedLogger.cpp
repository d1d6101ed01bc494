#ifdef SYNPATH_LOG_DEBUG
#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace SynPath {

namespace {

auto trim(std::string_view token) -> std::string_view {
    auto const first = token.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto const last = token.find_last_not_of(" \t");
    return token.substr(first, last - first + 1);
}

auto split_tags(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> tags;
    std::size_t              pos = 0;
    while (pos <= list.size()) {
        auto next  = list.find(',', pos);
        auto end   = (next == std::string_view::npos) ? list.size() : next;
        auto token = trim(list.substr(pos, end - pos));
        if (!token.empty())
            tags.emplace_back(token);
        if (next == std::string_view::npos)
            break;
        pos = next + 1;
    }
    return tags;
}

// Unset, empty, "0", "false" and "off" all count as disabled.
auto env_flag(char const* name) -> bool {
    char const* value = std::getenv(name);
    if (value == nullptr)
        return false;
    std::string lowered{value};
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return !(lowered.empty() || lowered == "0" || lowered == "false" || lowered == "off");
}

} // namespace

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger() : running(true), loggingEnabled(false), nextThreadNumber(0) {
    this->loadEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::loadEnvironment() -> void {
    if (env_flag("SYNPATH_LOG_ENABLED") || env_flag("SYNPATH_LOG"))
        this->loggingEnabled.store(true, std::memory_order_relaxed);

    if (env_flag("SYNPATH_LOG_CLEAR_DEFAULT_SKIPS"))
        this->skipTags.clear();

    if (char const* enable = std::getenv("SYNPATH_LOG_ENABLE_TAGS")) {
        for (auto& tag : split_tags(enable))
            this->enabledTags.insert(std::move(tag));
    }

    if (char const* skip = std::getenv("SYNPATH_LOG_SKIP_TAGS")) {
        for (auto& tag : split_tags(skip))
            this->skipTags.insert(std::move(tag));
    }
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::isLoggingEnabled() const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed);
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
        }
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    if (!this->enabledTags.empty())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return;
    for (auto const& tag : msg.tags)
        if (this->skipTags.contains(tag))
            return;

    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm     nowTm{};
    localtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';

    oss << '[';
    for (size_t i = 0; i < msg.tags.size(); ++i) {
        if (i > 0)
            oss << "][";
        oss << msg.tags[i];
    }
    oss << "] ";

    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    } else {
        std::string name = "Thread " + std::to_string(nextThreadNumber++);
        threadNames[id]  = name;
        return name;
    }
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

} // namespace SynPath
#endif // SYNPATH_LOG_DEBUG
