#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>
#include <vector>

namespace LS {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

[[nodiscard]] auto logLevelToString(LogLevel level) -> std::string_view;

struct LogField {
    std::string key;
    std::string value;
};

/*
 * Asynchronous tagged logger. Messages are queued by the caller and written by a
 * worker thread through the configured sink. Components receive the logger by
 * reference; there is no process-wide instance.
 */
class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level{LogLevel::Info};
        std::set<std::string>                 tags;
        std::string                           message;
        std::vector<LogField>                 fields;
        std::string                           threadName;
        std::source_location                  location;
    };

    using Sink = std::function<void(LogMessage const&)>;

    TaggedLogger();
    explicit TaggedLogger(Sink sink);
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    auto log(LogLevel                    level,
             std::string_view            tag,
             std::string                 message,
             std::vector<LogField>       fields   = {},
             std::source_location const& location = std::source_location::current()) -> void;

    auto debug(std::string_view tag, std::string message, std::vector<LogField> fields = {},
               std::source_location const& location = std::source_location::current()) -> void {
        this->log(LogLevel::Debug, tag, std::move(message), std::move(fields), location);
    }
    auto info(std::string_view tag, std::string message, std::vector<LogField> fields = {},
              std::source_location const& location = std::source_location::current()) -> void {
        this->log(LogLevel::Info, tag, std::move(message), std::move(fields), location);
    }
    auto warning(std::string_view tag, std::string message, std::vector<LogField> fields = {},
                 std::source_location const& location = std::source_location::current()) -> void {
        this->log(LogLevel::Warning, tag, std::move(message), std::move(fields), location);
    }
    auto error(std::string_view tag, std::string message, std::vector<LogField> fields = {},
               std::source_location const& location = std::source_location::current()) -> void {
        this->log(LogLevel::Error, tag, std::move(message), std::move(fields), location);
    }

    // Blocks until every message queued before the call has reached the sink.
    auto flush() -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setMinimumLevel(LogLevel level) -> void;
    auto skipTag(const std::string& tag) -> void;

    [[nodiscard]] static auto formatMessage(const LogMessage& msg) -> std::string;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drainedCv;
    std::size_t             inFlight{0};
    std::thread             workerThread;
    bool                    running;
    std::atomic<bool>       loggingEnabled;
    std::atomic<int>        minimumLevel;
    Sink                    sink;

    std::set<std::string> skipTags{};
    mutable std::mutex    skipTagsMutex;

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        processQueue() -> void;
    auto        isSkipped(const LogMessage& msg) const -> bool;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto writeToStderr(const LogMessage& msg) -> void;
    static auto getShortPath(const char* filepath) -> std::string;
};

} // namespace LS
