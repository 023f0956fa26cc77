#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>

#include "judge/test_harness.hpp"
#include "lang/interpreter.hpp"
#include "lang/parser.hpp"
#include "lang/script_error.hpp"
#include "sandbox/environment.hpp"

namespace evalbox::sandbox {
namespace {

bool Contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

std::string RunAndCapture(const Environment& environment, const std::string& source) {
    lang::Interpreter interpreter(environment.builtins);
    interpreter.ExecuteModule(lang::ParseSource(source));
    return environment.output->Contents();
}

TEST(EnvironmentTest, AllowListCoversSafeBuiltinsOnly) {
    const auto& names = EnvironmentBuilder::AllowedNames();
    for (const auto* name : {"len", "range", "sorted", "print", "isinstance", "ValueError", "dict", "frozenset", "slice"}) {
        EXPECT_TRUE(Contains(names, name)) << name;
    }
    for (const auto* name : {"eval", "exec", "open", "__import__", "getattr", "globals", "input", "compile"}) {
        EXPECT_FALSE(Contains(names, name)) << name;
    }
}

TEST(EnvironmentTest, BuiltinTableMatchesAllowList) {
    const auto environment = EnvironmentBuilder().Build();
    EXPECT_EQ(environment.builtins.size(), EnvironmentBuilder::AllowedNames().size());
    for (const auto& name : EnvironmentBuilder::AllowedNames()) {
        EXPECT_TRUE(environment.builtins.count(name)) << name;
    }
}

TEST(EnvironmentTest, ForbiddenNameIsUndefinedAtRuntime) {
    const auto environment = EnvironmentBuilder().Build();
    lang::Interpreter interpreter(environment.builtins);
    try {
        interpreter.ExecuteModule(lang::ParseSource("x = open\n"));
        FAIL() << "expected NameError";
    } catch (const lang::ScriptException& ex) {
        EXPECT_EQ(ex.TypeName(), "NameError");
    }
}

TEST(EnvironmentTest, PrintWritesToSink) {
    const auto environment = EnvironmentBuilder().Build();
    EXPECT_TRUE(environment.output->Empty());
    EXPECT_EQ(RunAndCapture(environment, "print('a', 1, sep='-', end='!')\nprint()\n"), "a-1!\n");
    EXPECT_FALSE(environment.output->Empty());
}

TEST(EnvironmentTest, EveryBuildHasAFreshSink) {
    EnvironmentBuilder builder;
    const auto first = builder.Build();
    const auto second = builder.Build();
    RunAndCapture(first, "print('leak')\n");
    EXPECT_TRUE(second.output->Empty());
    EXPECT_NE(first.output, second.output);
}

TEST(EnvironmentTest, SinkTruncatesAtCap) {
    EnvironmentOptions options;
    options.max_output_bytes = 8;
    const auto environment = EnvironmentBuilder(options).Build();
    EXPECT_EQ(RunAndCapture(environment, "print('0123456789')\n"), "01234567");
    EXPECT_TRUE(environment.output->Truncated());
    environment.output->Clear();
    EXPECT_TRUE(environment.output->Empty());
    EXPECT_FALSE(environment.output->Truncated());
}

TEST(EnvironmentTest, ExtraBuiltinsAreCallable) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    EnvironmentOptions options;
    options.extra_builtins["touch"] = [calls](lang::Interpreter&, lang::CallArguments&) {
        calls->fetch_add(1);
        return lang::Value::None();
    };
    const auto environment = EnvironmentBuilder(options).Build();
    RunAndCapture(environment, "touch()\ntouch()\n");
    EXPECT_EQ(calls->load(), 2);
}

// A submission rejected by the security stages must not have executed any
// statement, observable through a side-effect builtin.
TEST(EnvironmentTest, RejectedSubmissionHasNoSideEffects) {
    auto calls = std::make_shared<std::atomic<int>>(0);
    judge::HarnessOptions options;
    options.session.environment.extra_builtins["touch"] = [calls](lang::Interpreter&, lang::CallArguments&) {
        calls->fetch_add(1);
        return lang::Value::None();
    };
    judge::TestHarness harness(options);

    auto verdict = harness.Evaluate({"touch()\nimport os\ndef f():\n    return 1\n", "f"}, {});
    EXPECT_EQ(verdict.category, judge::Category::kSecurityViolation);

    verdict = harness.Evaluate({"touch()\nalias = eval\ndef f():\n    return 1\n", "f"}, {});
    EXPECT_EQ(verdict.category, judge::Category::kSecurityViolation);

    EXPECT_EQ(calls->load(), 0);

    verdict = harness.Evaluate({"touch()\ndef f():\n    return 1\n", "f"}, {{{}, lang::Value::Int(1)}});
    EXPECT_TRUE(verdict.passed);
    EXPECT_EQ(calls->load(), 1);
}

}  // namespace
}  // namespace evalbox::sandbox
