#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>
#include "log/TaggedLogger.hpp"

#include <iostream>
#include <mutex>

struct ShowTestStart : public doctest::IReporter {
    ShowTestStart(const doctest::ContextOptions& /* in */) {
    }
    void test_case_start(const doctest::TestCaseData& in) override {
#ifdef SC_LOG_DEBUG
        std::lock_guard<std::mutex> lock(SC::TaggedLogger::coutMutex);
#endif
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
#ifdef SC_LOG_DEBUG
        std::lock_guard<std::mutex> lock(SC::TaggedLogger::coutMutex);
#endif
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

// SUBSCACHE_LOG / SUBSCACHE_LOG_ENABLED turn on cache logging for the run.
int main(int argc, char** argv) {
    doctest::Context context;
    context.applyCommandLine(argc, argv);

#ifdef SC_LOG_DEBUG
    SC::set_thread_name("TestMain");
#endif

    int const result = context.run();

#ifdef SC_LOG_DEBUG
    if (!context.shouldExit()) {
        sc_log(result == 0 ? "All tests passed" : "Some tests failed", "TEST");
    }
#endif
    return result;
}
