#include <gtest/gtest.h>

#include "security/security_filter.hpp"

namespace evalbox::security {
namespace {

class SecurityFilterTest : public ::testing::Test {
protected:
    std::optional<SecurityViolation> Check(const std::string& source) const {
        return filter_.Check(source);
    }

    SecurityFilter filter_;
};

TEST_F(SecurityFilterTest, AcceptsOrdinaryCode) {
    EXPECT_FALSE(Check("def add(a, b):\n    return a + b\n"));
    EXPECT_FALSE(Check("def f(items):\n    return sorted(items, key=len)\n"));
}

TEST_F(SecurityFilterTest, RejectsModuleImports) {
    for (const std::string module : {"os", "sys", "subprocess"}) {
        const auto violation = Check("import " + module + "\n");
        ASSERT_TRUE(violation) << module;
        EXPECT_EQ(violation->reason, "Importing '" + module + "' module is not allowed");
        EXPECT_EQ(violation->construct, module);
    }
}

TEST_F(SecurityFilterTest, ImportRuleNeedsWholeWord) {
    EXPECT_FALSE(Check("import osmosis_helpers\n"));
}

TEST_F(SecurityFilterTest, RejectsForbiddenCalls) {
    const auto violation = Check("def f(s):\n    return eval(s)\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "Using 'eval()' is not allowed");
    EXPECT_EQ(violation->construct, "eval");
    EXPECT_EQ(violation->line, 2);

    EXPECT_TRUE(Check("exec ('x = 1')"));
    EXPECT_TRUE(Check("getattr(x, 'y')"));
    EXPECT_TRUE(Check("__import__('os')"));
    EXPECT_TRUE(Check("globals()"));
}

TEST_F(SecurityFilterTest, CallRuleIgnoresSimilarNames) {
    EXPECT_FALSE(Check("def evaluate(x):\n    return x\nevaluate(1)\n"));
    EXPECT_FALSE(Check("my_eval = 3\n"));
}

TEST_F(SecurityFilterTest, OpenHasItsOwnMessage) {
    const auto violation = Check("data = open('/etc/passwd').read()\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "File operations with 'open()' are not allowed");
}

TEST_F(SecurityFilterTest, RejectsDunderAttributes) {
    const auto violation = Check("x = ()\ny = 1\nz = x.__class__.__bases__\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "Accessing '__class__' is not allowed");
    EXPECT_EQ(violation->line, 3);
}

TEST_F(SecurityFilterTest, FirstRuleInOrderWins) {
    // The import rule precedes the call rule even though eval appears first.
    const auto violation = Check("eval('1')\nimport os\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->construct, "os");
    EXPECT_EQ(violation->line, 2);
}

TEST_F(SecurityFilterTest, MatchesInsideStringsAndComments) {
    EXPECT_TRUE(Check("# never call eval(x)\ndef f():\n    return 1\n"));
    EXPECT_TRUE(Check("s = 'open(file)'\n"));
}

TEST_F(SecurityFilterTest, LongWhitespaceRunsDoNotExhaustTheMatcher) {
    EXPECT_FALSE(Check("import" + std::string(100000, ' ') + "y"));

    const auto spaced = Check("import" + std::string(100000, ' ') + "os");
    ASSERT_TRUE(spaced);
    EXPECT_EQ(spaced->construct, "os");
    EXPECT_EQ(spaced->line, 1);

    const auto wrapped = Check("import" + std::string(100000, '\n') + "sys");
    ASSERT_TRUE(wrapped);
    EXPECT_EQ(wrapped->construct, "sys");
    EXPECT_EQ(wrapped->line, 1);
}

TEST_F(SecurityFilterTest, LineNumbersSurviveCollapsedWhitespace) {
    const auto violation = Check("x = 1\n" + std::string(5000, '\n') + "   \t y = eval  ('2')\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->construct, "eval");
    EXPECT_EQ(violation->line, 5002);
}

TEST_F(SecurityFilterTest, RulesAreOrdered) {
    const auto& rules = SecurityFilter::Rules();
    ASSERT_FALSE(rules.empty());
    EXPECT_EQ(rules.front().construct, "os");
    EXPECT_EQ(rules.back().construct, "__builtins__");
}

}  // namespace
}  // namespace evalbox::security
