#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <thread>

#include "judge/test_harness.hpp"
#include "judge/verdict_cache.hpp"

namespace evalbox::judge {
namespace {

using namespace std::chrono_literals;
using lang::Value;

bool Has(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

std::vector<TestCase> AddCases() {
    return {
        {{Value::Int(2), Value::Int(3)}, Value::Int(5)},
        {{Value::Int(10), Value::Int(20)}, Value::Int(30)},
    };
}

class TestHarnessTest : public ::testing::TestWithParam<sandbox::Isolation> {
protected:
    HarnessOptions Options(std::chrono::milliseconds deadline = 5000ms) const {
        HarnessOptions options;
        options.session.isolation = GetParam();
        options.session.worker_path = EVALBOX_WORKER_PATH;
        options.case_deadline = deadline;
        return options;
    }

    EvaluationVerdict Evaluate(const std::string& source,
                               const std::string& target,
                               const std::vector<TestCase>& cases) const {
        return TestHarness(Options()).Evaluate(Submission{source, target}, cases);
    }
};

TEST_P(TestHarnessTest, CorrectSubmissionPasses) {
    const auto verdict = Evaluate("def add(a, b):\n    return a + b\n", "add", AddCases());
    EXPECT_TRUE(verdict.passed);
    EXPECT_EQ(verdict.category, Category::kPassed);
    EXPECT_EQ(verdict.cases_passed, 2u);
    EXPECT_EQ(verdict.message, "✅ All 2 test cases passed!");
}

TEST_P(TestHarnessTest, PrintInsteadOfReturn) {
    const auto verdict = Evaluate("def add(a, b):\n    print(a + b)\n", "add", AddCases());
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.category, Category::kOutputInsteadOfReturn);
    EXPECT_TRUE(Has(verdict.message, "print() instead of return"));
}

TEST_P(TestHarnessTest, MissingReturn) {
    const auto verdict = Evaluate("def add(a, b):\n    a + b\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kMissingReturn);
}

TEST_P(TestHarnessTest, ImportIsRejected) {
    const auto verdict = Evaluate("import os\ndef add(a, b):\n    return a + b\n", "add", AddCases());
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.category, Category::kSecurityViolation);
    EXPECT_TRUE(Has(verdict.message, "'os'"));
}

TEST_P(TestHarnessTest, AliasedForbiddenNameIsRejected) {
    const auto verdict = Evaluate("run = exec\ndef add(a, b):\n    return a + b\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kSecurityViolation);
    EXPECT_TRUE(Has(verdict.message, "'exec'"));
}

TEST_P(TestHarnessTest, InfiniteLoopTimesOutWithinDeadline) {
    const auto deadline = 300ms;
    const auto started = std::chrono::steady_clock::now();
    const auto verdict = TestHarness(Options(deadline))
                             .Evaluate({"def slow(n):\n  while True: pass\n", "slow"}, {{{Value::Int(1)}, Value::Int(1)}});
    const auto elapsed = std::chrono::steady_clock::now() - started;
    EXPECT_FALSE(verdict.passed);
    EXPECT_EQ(verdict.category, Category::kTimeout);
    EXPECT_TRUE(Has(verdict.message, "`(1,)`"));
    EXPECT_LT(elapsed, deadline + 2s);
}

TEST_P(TestHarnessTest, RuntimeFailureNamesInput) {
    const auto verdict = Evaluate("def first(xs):\n    return xs[5]\n", "first",
                                  {{{Value::List({Value::Int(1), Value::Int(2)})}, Value::Int(1)}});
    EXPECT_EQ(verdict.category, Category::kRuntimeFailure);
    ASSERT_TRUE(verdict.runtime_kind);
    EXPECT_EQ(*verdict.runtime_kind, RuntimeKind::kIndexError);
    EXPECT_EQ(verdict.error_kind, "IndexError");
    EXPECT_TRUE(Has(verdict.message, "([1, 2],)"));
    EXPECT_TRUE(Has(verdict.message, "📍 Line 2"));
}

TEST_P(TestHarnessTest, ArithmeticFailure) {
    const auto verdict = Evaluate("def div(a, b):\n    return a // b\n", "div",
                                  {{{Value::Int(1), Value::Int(0)}, Value::Int(0)}});
    EXPECT_EQ(verdict.category, Category::kRuntimeFailure);
    EXPECT_EQ(*verdict.runtime_kind, RuntimeKind::kArithmeticError);
    EXPECT_EQ(verdict.error_kind, "ZeroDivisionError");
}

TEST_P(TestHarnessTest, ValueMismatchStopsAtFirstFailure) {
    const auto verdict = Evaluate("def add(a, b):\n    return 5\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kValueMismatch);
    EXPECT_EQ(verdict.cases_passed, 1u);
    EXPECT_FALSE(verdict.type_mismatch);
    EXPECT_TRUE(Has(verdict.message, "`(10, 20)`"));
    EXPECT_TRUE(Has(verdict.message, "✅ **Expected:** `30`"));
}

TEST_P(TestHarnessTest, TypeMismatchIsNoted) {
    const auto verdict = Evaluate("def add(a, b):\n    return str(a + b)\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kValueMismatch);
    EXPECT_TRUE(verdict.type_mismatch);
    EXPECT_TRUE(Has(verdict.message, "Expected `int`, got `str`"));
}

TEST_P(TestHarnessTest, FloatsCompareExactly) {
    const auto verdict = Evaluate("def add(a, b):\n    return a + b\n", "add",
                                  {{{Value::Float(0.1), Value::Float(0.2)}, Value::Float(0.3)}});
    EXPECT_EQ(verdict.category, Category::kValueMismatch);
    EXPECT_FALSE(verdict.type_mismatch);
}

TEST_P(TestHarnessTest, WrongNameListsCallables) {
    const auto verdict = Evaluate("def ad(a, b):\n    return a + b\nlimit = 3\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kNameResolutionFailure);
    EXPECT_TRUE(Has(verdict.message, "`add`"));
    EXPECT_TRUE(Has(verdict.message, "Found: `ad`"));
}

TEST_P(TestHarnessTest, SyntaxErrorShowsExcerpt) {
    const auto verdict = Evaluate("def add(a, b)\n    return a + b\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(verdict.message, "❌ Syntax Error"));
    EXPECT_TRUE(Has(verdict.message, "→ 1: def add(a, b)"));
}

TEST_P(TestHarnessTest, TopLevelExceptionIsDefinitionFailure) {
    const auto verdict = Evaluate("table = {}['missing']\ndef add(a, b):\n    return a + b\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(verdict.message, "KeyError"));
}

TEST_P(TestHarnessTest, HelpersAndRecursionWork) {
    const auto verdict = Evaluate(
        "def _fib(n, memo):\n"
        "    if n < 2:\n"
        "        return n\n"
        "    if n not in memo:\n"
        "        memo[n] = _fib(n - 1, memo) + _fib(n - 2, memo)\n"
        "    return memo[n]\n"
        "def fib(n):\n"
        "    return _fib(n, {})\n",
        "fib", {{{Value::Int(10)}, Value::Int(55)}, {{Value::Int(50)}, Value::Int(12586269025)}});
    EXPECT_TRUE(verdict.passed) << verdict.message;
}

TEST_P(TestHarnessTest, RepeatedEvaluationIsIdempotent) {
    const std::string source = "def add(a, b):\n    return a - b\n";
    const auto first = Evaluate(source, "add", AddCases());
    const auto second = Evaluate(source, "add", AddCases());
    EXPECT_EQ(first.category, second.category);
    EXPECT_EQ(first.message, second.message);
    EXPECT_EQ(first.cases_passed, second.cases_passed);
}

TEST_P(TestHarnessTest, InputsAreNotMutated) {
    const std::vector<TestCase> cases = {{{Value::List()}, Value::Int(1)}};
    const auto verdict = Evaluate("def grow(xs):\n    xs.append(0)\n    return len(xs)\n", "grow", cases);
    EXPECT_TRUE(verdict.passed) << verdict.message;
    EXPECT_EQ(lang::Repr(cases[0].inputs[0]), "[]");
}

TEST_P(TestHarnessTest, SolutionsMayDefineClasses) {
    const auto verdict = Evaluate(
        "class Stack:\n"
        "    def __init__(self):\n"
        "        self.items = []\n"
        "    def push(self, item):\n"
        "        self.items.append(item)\n"
        "    def pop(self):\n"
        "        return self.items.pop()\n"
        "    def __len__(self):\n"
        "        return len(self.items)\n"
        "def add(a, b):\n"
        "    stack = Stack()\n"
        "    stack.push(a)\n"
        "    stack.push(b)\n"
        "    return stack.pop() + stack.pop() + len(stack)\n",
        "add", AddCases());
    EXPECT_TRUE(verdict.passed) << verdict.message;
}

TEST_P(TestHarnessTest, DictFromKeysKeepsFirstOccurrences) {
    const std::vector<TestCase> cases = {
        {{Value::List({Value::Int(1), Value::Int(1), Value::Int(2), Value::Int(3), Value::Int(3)})},
         Value::List({Value::Int(1), Value::Int(2), Value::Int(3)})},
    };
    const auto verdict = Evaluate("def remove_duplicates_sorted(arr):\n    return list(dict.fromkeys(arr))\n",
                                  "remove_duplicates_sorted", cases);
    EXPECT_TRUE(verdict.passed) << verdict.message;
}

TEST_P(TestHarnessTest, ReturnedInstanceIsShownByItsRepr) {
    const auto verdict = Evaluate(
        "class Box:\n"
        "    def __init__(self, value):\n"
        "        self.value = value\n"
        "    def __repr__(self):\n"
        "        return 'Box(' + repr(self.value) + ')'\n"
        "def add(a, b):\n"
        "    return Box(a + b)\n",
        "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kValueMismatch);
    EXPECT_TRUE(Has(verdict.message, "Box(5)")) << verdict.message;
}

TEST_P(TestHarnessTest, UnsupportedConstructIsNamed) {
    const auto verdict = Evaluate("def add(a, b):\n    with a:\n        return a + b\n", "add", AddCases());
    EXPECT_EQ(verdict.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(verdict.message, "❌ Unsupported Feature")) << verdict.message;
    EXPECT_FALSE(Has(verdict.message, "Syntax Error"));
}

TEST_P(TestHarnessTest, HostileValuesDoNotCrashTheHost) {
    const std::vector<TestCase> cases = {{{Value::Str("abc")}, Value::Str("b")}};
    const auto sliced = Evaluate("def pick(s):\n    return s[1:9223372036854775807:9223372036854775807]\n",
                                 "pick", cases);
    EXPECT_TRUE(sliced.passed) << sliced.message;

    const auto nested = Evaluate(
        "def pick(s):\n"
        "    x = []\n"
        "    for i in range(100000):\n"
        "        x = [x]\n"
        "    return x\n",
        "pick", cases);
    EXPECT_EQ(nested.category, Category::kRuntimeFailure);
    EXPECT_TRUE(Has(nested.message, "RecursionError")) << nested.message;

    const auto cyclic = Evaluate("def pick(s):\n    x = [s]\n    x.append(x)\n    return x[0][1]\n", "pick", cases);
    EXPECT_TRUE(cyclic.passed) << cyclic.message;
}

INSTANTIATE_TEST_SUITE_P(Isolation, TestHarnessTest,
                         ::testing::Values(sandbox::Isolation::kThread, sandbox::Isolation::kProcess),
                         [](const ::testing::TestParamInfo<sandbox::Isolation>& info) {
                             return std::string(sandbox::ToString(info.param));
                         });

TEST(TestHarnessCacheTest, SecondEvaluationIsServedFromCache) {
    auto cache = std::make_shared<InMemoryVerdictCache>(8);
    TestHarness harness(HarnessOptions{}, cache);
    const Submission submission{"def add(a, b):\n    return a + b\n", "add"};

    const auto first = harness.Evaluate(submission, AddCases());
    const auto second = harness.Evaluate(submission, AddCases());
    EXPECT_TRUE(first.passed);
    EXPECT_EQ(first.message, second.message);
    EXPECT_EQ(cache->hits(), 1u);
    EXPECT_EQ(cache->size(), 1u);
}

TEST(TestHarnessConcurrencyTest, IndependentEvaluationsRunInParallel) {
    const TestHarness harness;
    constexpr int kThreads = 8;
    std::vector<EvaluationVerdict> verdicts(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&harness, &verdicts, i]() {
            const std::string source = "def scale(x):\n    print(x)\n    return x * " + std::to_string(i) + "\n";
            verdicts[static_cast<std::size_t>(i)] =
                harness.Evaluate({source, "scale"}, {{{Value::Int(3)}, Value::Int(3 * i)}});
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& verdict : verdicts) {
        EXPECT_TRUE(verdict.passed) << verdict.message;
    }
}

TEST(EvaluateTest, FreeFunctionUsesDefaults) {
    const auto verdict = judge::Evaluate("def add(a, b):\n    return a + b\n", "add", AddCases());
    EXPECT_TRUE(verdict.passed);
}

}  // namespace
}  // namespace evalbox::judge
