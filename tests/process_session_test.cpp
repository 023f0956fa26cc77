#include <gtest/gtest.h>

#include <chrono>

#include "sandbox/process_session.hpp"

namespace evalbox::sandbox {
namespace {

using namespace std::chrono_literals;

class ProcessSessionTest : public ::testing::Test {
protected:
    SessionConfig Config() const {
        SessionConfig config;
        config.isolation = Isolation::kProcess;
        config.worker_path = EVALBOX_WORKER_PATH;
        config.memory_limit_mb = 256;
        return config;
    }

    std::unique_ptr<ExecutionSession> Defined(const std::string& source, SessionConfig config) {
        auto session = CreateSession(config, source);
        const auto outcome = session->Define(5000ms);
        EXPECT_TRUE(outcome.ok()) << outcome.error_kind << ": " << outcome.detail;
        return session;
    }
};

TEST_F(ProcessSessionTest, DefinesAndCalls) {
    auto session = Defined(
        "def pair(a, b):\n"
        "    print('called')\n"
        "    return (a, [b] * 2)\n"
        "_hidden = lambda: 0\n"
        "limit = 3\n",
        Config());
    EXPECT_EQ(session->Callables(), (std::vector<std::string>{"pair"}));
    EXPECT_TRUE(session->HasCallable("pair"));
    EXPECT_FALSE(session->HasCallable("_hidden"));

    const auto outcome = session->Call("pair", {lang::Value::Int(1), lang::Value::Str("x")}, 5000ms);
    ASSERT_TRUE(outcome.ok()) << outcome.detail;
    EXPECT_EQ(lang::Repr(outcome.value), "(1, ['x', 'x'])");
    EXPECT_EQ(outcome.output, "called\n");
}

TEST_F(ProcessSessionTest, SyntaxErrorFailsDefinition) {
    auto session = CreateSession(Config(), "def f(:\n    return 1\n");
    const auto outcome = session->Define(5000ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kDefinitionFailure);
    EXPECT_EQ(outcome.error_kind, "SyntaxError");
    EXPECT_EQ(outcome.line, 1);
}

TEST_F(ProcessSessionTest, TopLevelExceptionFailsDefinition) {
    auto session = CreateSession(Config(), "x = 1 / 0\n");
    const auto outcome = session->Define(5000ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kDefinitionFailure);
    EXPECT_EQ(outcome.error_kind, "ZeroDivisionError");
}

TEST_F(ProcessSessionTest, RuntimeFailureCarriesLine) {
    auto session = Defined("def f(items):\n    return items[10]\n", Config());
    const auto outcome = session->Call("f", {lang::Value::List({lang::Value::Int(1)})}, 5000ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.error_kind, "IndexError");
    EXPECT_EQ(outcome.line, 2);
}

TEST_F(ProcessSessionTest, KillsWorkerAtDeadline) {
    auto session = Defined("def spin():\n    while True:\n        pass\n", Config());
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = session->Call("spin", {}, 300ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_EQ(outcome.kind, OutcomeKind::kTimeout);
    EXPECT_LT(elapsed, 2s);

    // Every call gets a fresh worker, so the session stays usable.
    EXPECT_EQ(session->Call("spin", {}, 100ms).kind, OutcomeKind::kTimeout);
}

TEST_F(ProcessSessionTest, MemoryLimitIsEnforced) {
    auto config = Config();
    config.memory_limit_mb = 128;
    auto session = Defined("def hog():\n    return [0] * 9000000\n", config);
    const auto outcome = session->Call("hog", {}, 5000ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.error_kind, "MemoryError");
}

TEST_F(ProcessSessionTest, MissingWorkerIsInternalError) {
    auto config = Config();
    config.worker_path = "/nonexistent/evalbox-worker";
    auto session = CreateSession(config, "def f():\n    return 1\n");
    EXPECT_EQ(session->Define(1000ms).kind, OutcomeKind::kInternalError);
}

TEST_F(ProcessSessionTest, CallBeforeDefineIsInternalError) {
    auto session = CreateSession(Config(), "def f():\n    return 1\n");
    EXPECT_EQ(session->Call("f", {}, 1000ms).kind, OutcomeKind::kInternalError);
}

}  // namespace
}  // namespace evalbox::sandbox
