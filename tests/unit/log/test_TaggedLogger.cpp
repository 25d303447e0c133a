#include "../LayerSetsTestHelper.hpp"

#include <layersets/log/TaggedLogger.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <functional>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace LS;

namespace {

auto captureStderr(std::function<void()> fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

auto fixedMessage() -> TaggedLogger::LogMessage {
    TaggedLogger::LogMessage msg;
    // 2024-03-01T12:34:56.789Z
    msg.timestamp  = std::chrono::system_clock::time_point{std::chrono::milliseconds{1709296496789}};
    msg.level      = LogLevel::Warning;
    msg.tags       = {"RevisionStore"};
    msg.message    = "capacity check failed";
    msg.threadName = "worker";
    return msg;
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("sink_receives_messages_with_fields") {
    Test::CollectingLog log;
    log.logger.warning("Store", "saved", {{"revision", "3"}, {"set", "My Set"}});

    auto messages = log.messages();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].level == LogLevel::Warning);
    CHECK(messages[0].tags.count("Store") == 1);
    CHECK(messages[0].message == "saved");
    REQUIRE(messages[0].fields.size() == 2);
    CHECK(messages[0].fields[1].key == "set");
    CHECK(messages[0].fields[1].value == "My Set");
    CHECK(messages[0].threadName == "test");
}

TEST_CASE("flush_waits_for_every_queued_message") {
    Test::CollectingLog log;
    for (int i = 0; i < 200; ++i)
        log.logger.info("Bulk", "message " + std::to_string(i));
    auto messages = log.messages();
    REQUIRE(messages.size() == 200);
    CHECK(messages.front().message == "message 0");
    CHECK(messages.back().message == "message 199");
}

TEST_CASE("minimum_level_filters_lower_levels") {
    Test::CollectingLog log;
    log.logger.setMinimumLevel(LogLevel::Warning);
    log.logger.debug("Level", "debug");
    log.logger.info("Level", "info");
    log.logger.warning("Level", "warning");
    log.logger.error("Level", "error");

    auto messages = log.messages();
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].message == "warning");
    CHECK(messages[1].message == "error");
}

TEST_CASE("skipped_tags_never_reach_the_sink") {
    Test::CollectingLog log;
    log.logger.skipTag("Noisy");
    log.logger.info("Noisy", "dropped");
    log.logger.info("Quiet", "kept");

    CHECK_FALSE(log.contains("Noisy", "dropped"));
    CHECK(log.contains("Quiet", "kept"));
}

TEST_CASE("set_logging_enabled_suppresses_output") {
    Test::CollectingLog log;
    log.logger.setLoggingEnabled(false);
    log.logger.error("Test", "disabled");
    log.logger.setLoggingEnabled(true);
    log.logger.error("Test", "enabled");

    auto messages = log.messages();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].message == "enabled");
}

TEST_CASE("unnamed_threads_get_numbered_names") {
    Test::CollectingLog log;
    std::thread worker([&] { log.logger.info("Worker", "from thread"); });
    worker.join();

    auto messages = log.messages();
    REQUIRE(messages.size() == 1);
    CHECK(messages[0].threadName.starts_with("Thread "));
}

TEST_CASE("format_message_layout") {
    auto msg = fixedMessage();
    CHECK(TaggedLogger::formatMessage(msg) == "2024-03-01T12:34:56.789Z WARN [RevisionStore] [worker] capacity check failed");

    msg.fields = {{"metric", "named_sets"}, {"limit", "15"}};
    CHECK(TaggedLogger::formatMessage(msg)
          == "2024-03-01T12:34:56.789Z WARN [RevisionStore] [worker] capacity check failed metric=named_sets limit=15");
}

TEST_CASE("format_message_quotes_awkward_values") {
    auto msg   = fixedMessage();
    msg.fields = {{"set", "My Set"}, {"empty", ""}, {"expr", "a=b"}, {"quote", "say \"hi\""}};
    auto line  = TaggedLogger::formatMessage(msg);
    CHECK(line.find("set=\"My Set\"") != std::string::npos);
    CHECK(line.find("empty=\"\"") != std::string::npos);
    CHECK(line.find("expr=\"a=b\"") != std::string::npos);
    CHECK(line.find("quote=\"say \\\"hi\\\"\"") != std::string::npos);
}

TEST_CASE("level_names") {
    CHECK(logLevelToString(LogLevel::Debug) == "DEBUG");
    CHECK(logLevelToString(LogLevel::Info) == "INFO");
    CHECK(logLevelToString(LogLevel::Warning) == "WARN");
    CHECK(logLevelToString(LogLevel::Error) == "ERROR");
}

TEST_CASE("default_sink_writes_to_stderr") {
    auto output = captureStderr([] {
        TaggedLogger logger;
        logger.setThreadName("Worker-7");
        logger.info("TestTag", "hello log", {{"k", "v"}});
        logger.flush();
    });

    CHECK(output.find("INFO [TestTag] [Worker-7]") != std::string::npos);
    CHECK(output.find("hello log k=v") != std::string::npos);
}

TEST_CASE("short_path_includes_parent_directory") {
    Test::CollectingLog log;
#line 42 "dir/subdir/TaggedLoggerChild.cpp"
    log.logger.info("Solo", "has parent");
#line 156 "tests/unit/log/test_TaggedLogger.cpp"
    auto messages = log.messages();
    REQUIRE(messages.size() == 1);
    CHECK(TaggedLogger::formatMessage(messages[0]).find("[subdir/TaggedLoggerChild.cpp:42]") != std::string::npos);
}

TEST_CASE("short_path_handles_file_without_parent_directory") {
    Test::CollectingLog log;
#line 500 "TaggedLoggerNoParent.cpp"
    log.logger.info("Solo", "no parent path");
#line 166 "tests/unit/log/test_TaggedLogger.cpp"
    auto messages = log.messages();
    REQUIRE(messages.size() == 1);
    CHECK(TaggedLogger::formatMessage(messages[0]).find("[TaggedLoggerNoParent.cpp:500]") != std::string::npos);
}

} // TEST_SUITE
