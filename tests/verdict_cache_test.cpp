#include <gtest/gtest.h>

#include "judge/verdict_cache.hpp"

namespace evalbox::judge {
namespace {

using namespace std::chrono_literals;

EvaluationVerdict VerdictWithMessage(const std::string& message) {
    EvaluationVerdict verdict;
    verdict.message = message;
    verdict.category = Category::kPassed;
    verdict.passed = true;
    return verdict;
}

std::vector<TestCase> Cases() {
    return {{{lang::Value::Int(2), lang::Value::Int(3)}, lang::Value::Int(5)}};
}

TEST(InMemoryVerdictCacheTest, StoresAndCountsLookups) {
    InMemoryVerdictCache cache(4);
    EXPECT_FALSE(cache.Lookup("a"));
    cache.Store("a", VerdictWithMessage("first"));
    const auto hit = cache.Lookup("a");
    ASSERT_TRUE(hit);
    EXPECT_EQ(hit->message, "first");
    EXPECT_EQ(cache.hits(), 1u);
    EXPECT_EQ(cache.misses(), 1u);
}

TEST(InMemoryVerdictCacheTest, EvictsLeastRecentlyUsed) {
    InMemoryVerdictCache cache(2);
    cache.Store("a", VerdictWithMessage("a"));
    cache.Store("b", VerdictWithMessage("b"));
    ASSERT_TRUE(cache.Lookup("a"));
    cache.Store("c", VerdictWithMessage("c"));
    EXPECT_EQ(cache.size(), 2u);
    EXPECT_TRUE(cache.Lookup("a"));
    EXPECT_FALSE(cache.Lookup("b"));
    EXPECT_TRUE(cache.Lookup("c"));
}

TEST(InMemoryVerdictCacheTest, StoreReplacesExistingEntry) {
    InMemoryVerdictCache cache(2);
    cache.Store("a", VerdictWithMessage("old"));
    cache.Store("a", VerdictWithMessage("new"));
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.Lookup("a")->message, "new");
}

TEST(CacheKeyTest, StableForEqualInputs) {
    const Submission submission{"def add(a, b):\n    return a + b\n", "add"};
    const auto first = CacheKey(submission, Cases(), 5000ms, "thread");
    const auto second = CacheKey(submission, Cases(), 5000ms, "thread");
    EXPECT_EQ(first, second);
    EXPECT_EQ(first.size(), 64u);
}

TEST(CacheKeyTest, SensitiveToEverythingThatChangesTheVerdict) {
    const Submission submission{"def add(a, b):\n    return a + b\n", "add"};
    const auto base = CacheKey(submission, Cases(), 5000ms, "thread");

    EXPECT_NE(base, CacheKey({submission.source + "\n", "add"}, Cases(), 5000ms, "thread"));
    EXPECT_NE(base, CacheKey({submission.source, "plus"}, Cases(), 5000ms, "thread"));
    EXPECT_NE(base, CacheKey(submission, Cases(), 1000ms, "thread"));
    EXPECT_NE(base, CacheKey(submission, Cases(), 5000ms, "process"));

    auto cases = Cases();
    cases[0].expected = lang::Value::Float(5.0);
    EXPECT_NE(base, CacheKey(submission, cases, 5000ms, "thread"));

    cases = Cases();
    cases[0].inputs[0] = lang::Value::Bool(true);
    EXPECT_NE(base, CacheKey(submission, cases, 5000ms, "thread"));
}

}  // namespace
}  // namespace evalbox::judge
