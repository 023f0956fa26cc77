#include <gtest/gtest.h>

#include "lang/parser.hpp"
#include "security/structural_check.hpp"

namespace evalbox::security {
namespace {

std::optional<SecurityViolation> Check(const std::string& source) {
    const auto program = lang::ParseSource(source);
    return StructuralChecker().Check(*program);
}

TEST(StructuralCheckTest, AcceptsOrdinaryCode) {
    EXPECT_FALSE(Check(
        "def solve(items):\n"
        "    seen = set()\n"
        "    for item in items:\n"
        "        if item in seen:\n"
        "            return item\n"
        "        seen.add(item)\n"
        "    return None\n"));
    EXPECT_FALSE(Check("square = lambda x: x * x\n"));
}

TEST(StructuralCheckTest, SeesThroughAliasing) {
    const auto violation = Check("f = eval\ndef g(s):\n    return f(s)\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "Using 'eval' is not allowed");
    EXPECT_EQ(violation->line, 1);
}

TEST(StructuralCheckTest, RejectsEveryImport) {
    auto violation = Check("import math\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "Importing 'math' module is not allowed");

    violation = Check("def f():\n    from collections import deque\n    return deque()\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->construct, "collections");
    EXPECT_EQ(violation->line, 2);
}

TEST(StructuralCheckTest, RejectsDunderAttributes) {
    const auto violation = Check("def f(x):\n    return x.__dict__\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->reason, "Accessing '__dict__' is not allowed");
}

TEST(StructuralCheckTest, RejectsDunderNames) {
    const auto violation = Check("x = __builtins__\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->construct, "__builtins__");
}

TEST(StructuralCheckTest, RejectsRebindingForbiddenNames) {
    EXPECT_TRUE(Check("def eval(x):\n    return x\n"));
    EXPECT_TRUE(Check("def f(open):\n    return open\n"));
    EXPECT_TRUE(Check("def f(*vars):\n    return 1\n"));
    EXPECT_TRUE(Check("try:\n    pass\nexcept Exception as dir:\n    pass\n"));
    EXPECT_TRUE(Check("def f():\n    global input\n    return 1\n"));
}

TEST(StructuralCheckTest, InspectsNestedExpressions) {
    EXPECT_TRUE(Check("result = [compile for _ in range(3)]\n"));
    EXPECT_TRUE(Check("g = lambda: vars\n"));
    EXPECT_TRUE(Check("def f(x=locals):\n    return x\n"));
    EXPECT_TRUE(Check("s = f'{breakpoint}'\n"));
    EXPECT_TRUE(Check("def f(d):\n    return d.get('k', setattr)\n"));
}

TEST(StructuralCheckTest, AttributeNamesAreNotBareNames) {
    EXPECT_FALSE(Check("def f(d):\n    return d.keys()\n"));
}

TEST(StructuralCheckTest, ClassesMayDefineSpecialMethods) {
    EXPECT_FALSE(Check(
        "class Point(Base):\n"
        "    def __init__(self, x):\n"
        "        Base.__init__(self)\n"
        "        self.x = x\n"
        "    def __eq__(self, other):\n"
        "        return self.x == other.x\n"));
}

TEST(StructuralCheckTest, InspectsClassBodies) {
    const auto violation = Check("class A:\n    def run(self):\n        return eval('1')\n");
    ASSERT_TRUE(violation);
    EXPECT_EQ(violation->construct, "eval");
    EXPECT_EQ(violation->line, 3);
    EXPECT_TRUE(Check("class A:\n    def __getattribute__(self, name):\n        return 1\n"));
    EXPECT_TRUE(Check("class A(vars):\n    pass\n"));
    EXPECT_TRUE(Check("class open:\n    pass\n"));
    EXPECT_TRUE(Check("def f(x):\n    return x.__class__\n"));
    EXPECT_TRUE(Check("def __init__(self):\n    pass\n"));
    EXPECT_TRUE(Check("f = __init__\n"));
}

}  // namespace
}  // namespace evalbox::security
