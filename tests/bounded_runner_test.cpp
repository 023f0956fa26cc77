#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <new>
#include <stdexcept>
#include <thread>

#include "lang/script_error.hpp"
#include "sandbox/bounded_runner.hpp"

namespace evalbox::sandbox {
namespace {

using namespace std::chrono_literals;

TEST(RunGuardedTest, PassesSuccessThrough) {
    const auto outcome = RunGuarded([] { return ExecutionOutcome::Success(lang::Value::Int(7), "hi\n"); });
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value.AsInt(), 7);
    EXPECT_EQ(outcome.output, "hi\n");
}

TEST(RunGuardedTest, ScriptExceptionBecomesRuntimeFailure) {
    const auto outcome = RunGuarded([]() -> ExecutionOutcome {
        throw lang::ScriptException(lang::MakeException("ZeroDivisionError", "division by zero"), 4);
    });
    EXPECT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.error_kind, "ZeroDivisionError");
    EXPECT_EQ(outcome.detail, "division by zero");
    EXPECT_EQ(outcome.line, 4);
}

TEST(RunGuardedTest, CancellationBecomesTimeout) {
    const auto outcome = RunGuarded([]() -> ExecutionOutcome { throw lang::ExecutionCancelled(); });
    EXPECT_EQ(outcome.kind, OutcomeKind::kTimeout);
}

TEST(RunGuardedTest, AllocationFailureBecomesMemoryError) {
    const auto outcome = RunGuarded([]() -> ExecutionOutcome { throw std::bad_alloc(); });
    EXPECT_EQ(outcome.kind, OutcomeKind::kRuntimeFailure);
    EXPECT_EQ(outcome.error_kind, "MemoryError");
}

TEST(RunGuardedTest, HostExceptionBecomesInternalError) {
    const auto outcome = RunGuarded([]() -> ExecutionOutcome { throw std::logic_error("broken invariant"); });
    EXPECT_EQ(outcome.kind, OutcomeKind::kInternalError);
    EXPECT_EQ(outcome.detail, "broken invariant");
}

TEST(BoundedRunnerTest, ReturnsResultBeforeDeadline) {
    auto cancel = std::make_shared<lang::CancelToken>();
    const auto outcome = BoundedRunner::Run(
        [] { return ExecutionOutcome::Success(lang::Value::Str("done"), ""); }, cancel, 1000ms);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.value.AsStr(), "done");
    EXPECT_FALSE(cancel->cancelled());
}

TEST(BoundedRunnerTest, TimesOutAndCancels) {
    auto cancel = std::make_shared<lang::CancelToken>();
    const auto started = std::chrono::steady_clock::now();
    const auto outcome = BoundedRunner::Run(
        [cancel]() -> ExecutionOutcome {
            while (!cancel->cancelled()) {
                std::this_thread::sleep_for(1ms);
            }
            throw lang::ExecutionCancelled();
        },
        cancel, 100ms);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(outcome.kind, OutcomeKind::kTimeout);
    EXPECT_TRUE(cancel->cancelled());
    EXPECT_GE(elapsed, 100ms);
    EXPECT_LT(elapsed, 1000ms);
}

TEST(BoundedRunnerTest, TaskOutlivesCaller) {
    auto cancel = std::make_shared<lang::CancelToken>();
    auto finished = std::make_shared<std::atomic<bool>>(false);
    const auto outcome = BoundedRunner::Run(
        [finished]() -> ExecutionOutcome {
            std::this_thread::sleep_for(200ms);
            finished->store(true);
            return ExecutionOutcome::Success(lang::Value::None(), "");
        },
        cancel, 20ms);
    EXPECT_EQ(outcome.kind, OutcomeKind::kTimeout);
    EXPECT_FALSE(finished->load());

    const auto wait_until = std::chrono::steady_clock::now() + 2s;
    while (!finished->load() && std::chrono::steady_clock::now() < wait_until) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(finished->load());
}

}  // namespace
}  // namespace evalbox::sandbox
