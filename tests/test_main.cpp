#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include <layersets/log/TaggedLogger.hpp>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
        std::lock_guard<std::mutex> lock(LS::TaggedLogger::coutMutex);
        std::cout << "Test: " << in.m_name << std::endl;
    }
    void report_query(const doctest::QueryData&) override {
    }
    void test_run_start() override {
    }
    void test_run_end(const doctest::TestRunStats&) override {
    }
    void test_case_reenter(const doctest::TestCaseData&) override {
    }
    void test_case_end(const doctest::CurrentTestCaseStats&) override {
    }
    void test_case_exception(const doctest::TestCaseException&) override {
    }
    void subcase_start(const doctest::SubcaseSignature& in) override {
        std::lock_guard<std::mutex> lock(LS::TaggedLogger::coutMutex);
        std::cout << "\tSubcase: " << in.m_name << std::endl;
    }
    void subcase_end() override {
    }
    void log_assert(const doctest::AssertData&) override {
    }
    void log_message(const doctest::MessageData&) override {
    }
    void test_case_skipped(const doctest::TestCaseData&) override {
    }
};

REGISTER_LISTENER("test_start", 1, ShowTestStart);

int main(int argc, char** argv) {
    doctest::Context context;

    // Apply command line arguments
    context.applyCommandLine(argc, argv);

    // Check if we're in test discovery mode or if we should exit early
    if (context.shouldExit()) {
        return context.run();
    }

    // Components log to stderr during tests only when LAYERSETS_TEST_LOG is set (and not "0").
    if (const char* env_log = std::getenv("LAYERSETS_TEST_LOG")) {
        if (std::strcmp(env_log, "0") != 0) {
            std::cout << "Component logging enabled" << std::endl;
        }
    }

    return context.run();
}
