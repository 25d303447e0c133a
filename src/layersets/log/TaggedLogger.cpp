#include <layersets/log/TaggedLogger.hpp>

#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace LS {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto needsQuoting(std::string_view value) -> bool {
    if (value.empty())
        return true;
    for (char ch : value) {
        if (ch == ' ' || ch == '"' || ch == '=' || ch == '\n' || ch == '\t')
            return true;
    }
    return false;
}

} // namespace

std::mutex TaggedLogger::coutMutex;

auto logLevelToString(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

TaggedLogger::TaggedLogger() : TaggedLogger(Sink{}) {}

TaggedLogger::TaggedLogger(Sink sinkIn)
    : running(true)
    , loggingEnabled(true)
    , minimumLevel(static_cast<int>(LogLevel::Info))
    , sink(std::move(sinkIn))
    , nextThreadNumber(0) {
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

auto TaggedLogger::log(LogLevel                    level,
                       std::string_view            tag,
                       std::string                 message,
                       std::vector<LogField>       fields,
                       std::source_location const& location) -> void {
    if (!this->loggingEnabled.load(std::memory_order_relaxed))
        return;
    if (static_cast<int>(level) < this->minimumLevel.load(std::memory_order_relaxed))
        return;

    auto logMessage = LogMessage{.timestamp  = std::chrono::system_clock::now(),
                                 .level      = level,
                                 .tags       = {std::string{tag}},
                                 .message    = std::move(message),
                                 .fields     = std::move(fields),
                                 .threadName = getThreadName(std::this_thread::get_id()),
                                 .location   = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drainedCv.wait(lock, [this] { return this->messageQueue.empty() && this->inFlight == 0; });
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setMinimumLevel(LogLevel level) -> void {
    minimumLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

auto TaggedLogger::skipTag(const std::string& tag) -> void {
    std::lock_guard<std::mutex> lock(skipTagsMutex);
    skipTags.insert(tag);
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->drainedCv.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            ++this->inFlight;
            lock.unlock();
            if (!this->isSkipped(msg)) {
                if (this->sink)
                    this->sink(msg);
                else
                    writeToStderr(msg);
            }
            lock.lock();
            --this->inFlight;
        }
        this->drainedCv.notify_all();
    }
}

auto TaggedLogger::isSkipped(const LogMessage& msg) const -> bool {
    std::lock_guard<std::mutex> lock(skipTagsMutex);
    for (auto const& skip : this->skipTags)
        if (msg.tags.contains(skip))
            return true;
    return false;
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

auto TaggedLogger::formatMessage(const LogMessage& msg) -> std::string {
    const auto now      = msg.timestamp;
    const auto nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto nowTimeT = std::chrono::system_clock::to_time_t(now);
    std::tm    nowTm{};
    gmtime_r(&nowTimeT, &nowTm);

    std::ostringstream oss;
    oss << std::put_time(&nowTm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << "Z ";
    oss << logLevelToString(msg.level) << ' ';
    oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';
    oss << "[" << msg.threadName << "] ";
    if (msg.location.file_name() != nullptr && msg.location.file_name()[0] != '\0')
        oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message;
    for (auto const& field : msg.fields) {
        oss << ' ' << field.key << '=';
        if (needsQuoting(field.value))
            oss << std::quoted(field.value);
        else
            oss << field.value;
    }
    return oss.str();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) -> void {
    auto line = formatMessage(msg);
    line.push_back('\n');
    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << line << std::flush;
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

} // namespace LS
