#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "lang/interpreter.hpp"
#include "lang/parser.hpp"
#include "lang/script_error.hpp"
#include "sandbox/environment.hpp"

namespace evalbox::lang {
namespace {

class InterpreterTest : public ::testing::Test {
protected:
    void SetUp() override {
        environment_ = sandbox::EnvironmentBuilder().Build();
    }

    Interpreter& Run(const std::string& source, InterpreterLimits limits = {}) {
        interpreter_ = std::make_unique<Interpreter>(environment_.builtins, limits);
        interpreter_->ExecuteModule(ParseSource(source));
        return *interpreter_;
    }

    Value Global(const std::string& name) const {
        const auto* value = interpreter_->LookupGlobal(name);
        if (value == nullptr) {
            ADD_FAILURE() << "global '" << name << "' is not bound";
            return Value::None();
        }
        return *value;
    }

    std::string ReprOf(const std::string& source, const std::string& name = "result") {
        Run(source);
        return Repr(Global(name));
    }

    ScriptException Raised(const std::string& source) {
        try {
            Run(source);
        } catch (const ScriptException& ex) {
            return ex;
        }
        ADD_FAILURE() << "expected an exception from:\n" << source;
        return ScriptException(MakeException("RuntimeError", "no exception"));
    }

    sandbox::Environment environment_;
    std::unique_ptr<Interpreter> interpreter_;
};

TEST_F(InterpreterTest, Arithmetic) {
    EXPECT_EQ(ReprOf("result = (7 // 2, -7 // 2, -7 % 3, 7 / 2, 2 ** 10)"), "(3, -4, 2, 3.5, 1024)");
    EXPECT_EQ(ReprOf("result = 0.1 + 0.2"), "0.30000000000000004");
    EXPECT_EQ(ReprOf("result = True + True"), "2");
}

TEST_F(InterpreterTest, CallsFunctionsWithDefaultsAndVarargs) {
    Run("def f(a, b=10, *rest):\n"
        "    return a + b + sum(rest)\n");
    const auto f = Global("f");
    EXPECT_EQ(Repr(interpreter_->Call(f, std::vector<Value>{Value::Int(1)})), "11");
    EXPECT_EQ(Repr(interpreter_->Call(f, std::vector<Value>{Value::Int(1), Value::Int(2), Value::Int(3),
                                                            Value::Int(4)})),
              "10");
}

TEST_F(InterpreterTest, ClosuresCaptureByReference) {
    const auto source =
        "def counter():\n"
        "    n = 0\n"
        "    def step():\n"
        "        nonlocal n\n"
        "        n += 1\n"
        "        return n\n"
        "    return step\n"
        "c = counter()\n"
        "c()\n"
        "c()\n"
        "result = c()\n";
    EXPECT_EQ(ReprOf(source), "3");
}

TEST_F(InterpreterTest, UnboundLocal) {
    const auto error = Raised(
        "x = 1\n"
        "def f():\n"
        "    y = x\n"
        "    x = 2\n"
        "    return y\n"
        "f()\n");
    EXPECT_EQ(error.TypeName(), "UnboundLocalError");
    EXPECT_EQ(error.line(), 3);
}

TEST_F(InterpreterTest, ExceptionsAreCaughtByType) {
    const auto source =
        "def safe_div(a, b):\n"
        "    try:\n"
        "        return a / b\n"
        "    except ZeroDivisionError as e:\n"
        "        return str(e)\n"
        "    finally:\n"
        "        pass\n"
        "result = safe_div(1, 0)\n";
    EXPECT_EQ(ReprOf(source), "'division by zero'");
}

TEST_F(InterpreterTest, ExceptionHierarchy) {
    const auto source =
        "try:\n"
        "    [1, 2][5]\n"
        "except LookupError:\n"
        "    result = 'lookup'\n";
    EXPECT_EQ(ReprOf(source), "'lookup'");
}

TEST_F(InterpreterTest, UncaughtExceptionCarriesLine) {
    const auto error = Raised(
        "def f(items):\n"
        "    return items[3]\n"
        "f([1])\n");
    EXPECT_EQ(error.TypeName(), "IndexError");
    EXPECT_EQ(error.Message(), "list index out of range");
    EXPECT_EQ(error.line(), 2);
}

TEST_F(InterpreterTest, KeyErrorShowsKeyRepr) {
    const auto error = Raised("d = {'a': 1}\nd['b']\n");
    EXPECT_EQ(error.TypeName(), "KeyError");
    EXPECT_EQ(error.Message(), "'b'");
}

TEST_F(InterpreterTest, Comprehensions) {
    EXPECT_EQ(ReprOf("result = [x * x for x in range(5) if x % 2 == 0]"), "[0, 4, 16]");
    EXPECT_EQ(ReprOf("result = {k: v for k, v in zip('ab', [1, 2])}"), "{'a': 1, 'b': 2}");
    EXPECT_EQ(ReprOf("result = sum(x for x in range(101))"), "5050");
    EXPECT_EQ(ReprOf("x = 'outer'\nitems = [x for x in range(3)]\nresult = x"), "'outer'");
}

TEST_F(InterpreterTest, RecursionLimit) {
    InterpreterLimits limits;
    limits.max_call_depth = 50;
    try {
        Run("def down(n):\n    return down(n + 1)\ndown(0)\n", limits);
        FAIL() << "expected RecursionError";
    } catch (const ScriptException& ex) {
        EXPECT_EQ(ex.TypeName(), "RecursionError");
    }
}

TEST_F(InterpreterTest, ContainerLimit) {
    InterpreterLimits limits;
    limits.max_container_size = 1000;
    try {
        Run("result = [0] * 5000\n", limits);
        FAIL() << "expected MemoryError";
    } catch (const ScriptException& ex) {
        EXPECT_EQ(ex.TypeName(), "MemoryError");
    }
}

TEST_F(InterpreterTest, Formatting) {
    EXPECT_EQ(ReprOf("x = 3.14159\nresult = f'{x:.2f}|{42:>5}|{\"hi\"!r}'"), "\"3.14|   42|'hi'\"");
    EXPECT_EQ(ReprOf("result = '{} + {} = {}'.format(1, 2, 3)"), "'1 + 2 = 3'");
    EXPECT_EQ(ReprOf("result = str(1e16) + ' ' + repr(2.0)"), "'1e+16 2.0'");
}

TEST_F(InterpreterTest, StringAndListMethods) {
    EXPECT_EQ(ReprOf("result = ' a,b ,c '.strip().split(',')"), "['a', 'b ', 'c']");
    EXPECT_EQ(ReprOf("items = [3, 1, 2]\nitems.sort(reverse=True)\nresult = items"), "[3, 2, 1]");
    EXPECT_EQ(ReprOf("result = sorted(['bb', 'a', 'ccc'], key=len)"), "['a', 'bb', 'ccc']");
    EXPECT_EQ(ReprOf("result = '-'.join(reversed('abc'))"), "'c-b-a'");
}

TEST_F(InterpreterTest, IntegerOverflowRaises) {
    const auto error = Raised("result = 2 ** 64\n");
    EXPECT_EQ(error.TypeName(), "OverflowError");
}

TEST_F(InterpreterTest, CancelledTokenStopsLoops) {
    auto cancel = std::make_shared<CancelToken>();
    cancel->Cancel();
    Interpreter interpreter(environment_.builtins, {}, cancel);
    EXPECT_THROW(interpreter.ExecuteModule(ParseSource("while True:\n    pass\n")), ExecutionCancelled);
}

TEST_F(InterpreterTest, GlobalNamesInDefinitionOrder) {
    Run("b = 1\ndef a():\n    pass\nc = a\n");
    EXPECT_EQ(interpreter_->GlobalNames(), (std::vector<std::string>{"b", "a", "c"}));
}

TEST_F(InterpreterTest, HugeSliceStepsStayInBounds) {
    EXPECT_EQ(ReprOf("result = 'abc'[1:9223372036854775807:9223372036854775807]"), "'b'");
    EXPECT_EQ(ReprOf("result = [0, 1, 2, 3][::-9223372036854775807]"), "[3]");
    EXPECT_EQ(ReprOf("result = (0, 1, 2)[-9223372036854775807 - 1:9223372036854775807:2]"), "(0, 2)");
    EXPECT_EQ(ReprOf("result = [0, 1, 2]\n"
                     "result[0:9223372036854775807:9223372036854775807] = ['a']\n"),
              "['a', 1, 2]");
    EXPECT_EQ(ReprOf("result = [0, 1, 2]\n"
                     "del result[1::9223372036854775807]\n"),
              "[0, 2]");
}

TEST_F(InterpreterTest, DeeplyNestedValuesRaiseRecursionError) {
    const auto source =
        "x = []\n"
        "for i in range(100000):\n"
        "    x = [x]\n";
    EXPECT_EQ(Raised(std::string(source) + "s = str(x)\n").TypeName(), "RecursionError");
    EXPECT_EQ(Raised("t = ()\nfor i in range(100000):\n    t = (t,)\nh = hash(t)\n").TypeName(), "RecursionError");
    EXPECT_EQ(Raised(std::string(source) + "same = x == x[0]\n").TypeName(), "RecursionError");
    interpreter_.reset();
    SUCCEED();
}

TEST_F(InterpreterTest, CounterOverflowRaises) {
    EXPECT_EQ(Raised("result = list(enumerate([1, 2], 9223372036854775807))\n").TypeName(), "OverflowError");
    EXPECT_EQ(ReprOf("result = list(enumerate([1], 9223372036854775807))"), "[(9223372036854775807, 1)]");
    EXPECT_EQ(ReprOf("result = range(-9223372036854775807 - 1, 9223372036854775807)[-1]"),
              "9223372036854775806");
    EXPECT_EQ(Raised("n = len(range(-9223372036854775807 - 1, 9223372036854775807))\n").TypeName(),
              "OverflowError");
}

TEST_F(InterpreterTest, NestedFormatFields) {
    EXPECT_EQ(ReprOf("result = '{:>{}}'.format(1, 5)"), "'    1'");
    EXPECT_EQ(ReprOf("result = '{0:{1}.{2}f}'.format(3.14159, 8, 2)"), "'    3.14'");
    EXPECT_EQ(ReprOf("result = '{:{fill}^7}'.format('x', fill='*')"), "'***x***'");
    const auto error = Raised("s = '{99999999999999999999}'.format(1)\n");
    EXPECT_EQ(error.TypeName(), "ValueError");
    EXPECT_EQ(error.Message(), "Too many decimal digits in format string");
}

TEST_F(InterpreterTest, DictFromKeys) {
    EXPECT_EQ(ReprOf("result = list(dict.fromkeys([3, 1, 3, 2, 1]))"), "[3, 1, 2]");
    EXPECT_EQ(ReprOf("result = dict.fromkeys('ab', 0)"), "{'a': 0, 'b': 0}");
}

TEST_F(InterpreterTest, HashOfMinusOneIsMinusTwo) {
    EXPECT_EQ(ReprOf("result = (hash(-1), hash(-2), hash(-1.0), hash(7))"), "(-2, -2, -2, 7)");
}

TEST_F(InterpreterTest, ClassesWithAttributesAndMethods) {
    const auto source =
        "class CustomLibrary:\n"
        "    \"\"\"Custom keywords.\"\"\"\n"
        "    ROBOT_LIBRARY_SCOPE = 'SUITE'\n"
        "\n"
        "    def __init__(self, base_url=None):\n"
        "        self.base_url = base_url\n"
        "        self.calls = 0\n"
        "\n"
        "    def make_email(self, name, domain='example.com'):\n"
        "        self.calls += 1\n"
        "        return f'{name}@{domain}'\n"
        "\n"
        "lib = CustomLibrary('https://api')\n"
        "result = (lib.make_email('ann'), lib.make_email('bob', 'mail.org'), lib.calls,\n"
        "          lib.base_url, lib.ROBOT_LIBRARY_SCOPE, CustomLibrary.ROBOT_LIBRARY_SCOPE,\n"
        "          isinstance(lib, CustomLibrary))\n";
    EXPECT_EQ(ReprOf(source),
              "('ann@example.com', 'bob@mail.org', 2, 'https://api', 'SUITE', 'SUITE', True)");
}

TEST_F(InterpreterTest, InheritanceCallsBaseMethodsExplicitly) {
    const auto source =
        "class Shape:\n"
        "    sides = 0\n"
        "    def __init__(self, name):\n"
        "        self.name = name\n"
        "    def describe(self):\n"
        "        return self.name + ' with ' + str(self.sides) + ' sides'\n"
        "class Square(Shape):\n"
        "    sides = 4\n"
        "    def __init__(self, size):\n"
        "        Shape.__init__(self, 'square')\n"
        "        self.size = size\n"
        "    def area(self):\n"
        "        return self.size ** 2\n"
        "sq = Square(3)\n"
        "result = (sq.describe(), sq.area(), isinstance(sq, Shape), isinstance(Shape('x'), Square))\n";
    EXPECT_EQ(ReprOf(source), "('square with 4 sides', 9, True, False)");
}

TEST_F(InterpreterTest, SpecialMethodsDriveOperators) {
    const auto source =
        "class Vec:\n"
        "    def __init__(self, x, y):\n"
        "        self.x = x\n"
        "        self.y = y\n"
        "    def __repr__(self):\n"
        "        return f'Vec({self.x}, {self.y})'\n"
        "    def __eq__(self, other):\n"
        "        return isinstance(other, Vec) and (self.x, self.y) == (other.x, other.y)\n"
        "    def __lt__(self, other):\n"
        "        return (self.x, self.y) < (other.x, other.y)\n"
        "    def __add__(self, other):\n"
        "        return Vec(self.x + other.x, self.y + other.y)\n"
        "    def __len__(self):\n"
        "        return 2\n"
        "    def __iter__(self):\n"
        "        return iter([self.x, self.y])\n"
        "a = Vec(1, 2)\n"
        "b = Vec(0, 5)\n"
        "result = (repr(a + b), a == Vec(1, 2), a != b, repr(sorted([a, b])), len(a), list(a), str(a))\n";
    EXPECT_EQ(ReprOf(source), "('Vec(1, 7)', True, True, '[Vec(0, 5), Vec(1, 2)]', 2, [1, 2], 'Vec(1, 2)')");
}

TEST_F(InterpreterTest, InstancesCanBeIterators) {
    const auto source =
        "class Countdown:\n"
        "    def __init__(self, start):\n"
        "        self.current = start\n"
        "    def __iter__(self):\n"
        "        return self\n"
        "    def __next__(self):\n"
        "        if self.current <= 0:\n"
        "            raise StopIteration\n"
        "        self.current -= 1\n"
        "        return self.current + 1\n"
        "c = Countdown(2)\n"
        "first = next(c)\n"
        "result = (first, [n for n in c], next(c, 'done'))\n";
    EXPECT_EQ(ReprOf(source), "(2, [1], 'done')");
}

TEST_F(InterpreterTest, ExceptionSubclassesAreCaught) {
    const auto source =
        "class InsufficientFunds(ValueError):\n"
        "    \"\"\"Raised when a withdrawal is too large.\"\"\"\n"
        "def withdraw(balance, amount):\n"
        "    if amount > balance:\n"
        "        raise InsufficientFunds('balance is ' + str(balance))\n"
        "    return balance - amount\n"
        "try:\n"
        "    withdraw(5, 10)\n"
        "except ValueError as e:\n"
        "    result = (str(e), isinstance(e, InsufficientFunds), withdraw(10, 5))\n";
    EXPECT_EQ(ReprOf(source), "('balance is 5', True, 5)");

    const auto error = Raised("class Custom(Exception):\n    pass\nraise Custom('boom')\n");
    EXPECT_EQ(error.TypeName(), "Custom");
    EXPECT_EQ(error.Message(), "boom");
}

TEST_F(InterpreterTest, ClassErrors) {
    EXPECT_EQ(Raised("class A:\n    pass\nA(1)\n").Message(), "A() takes no arguments");
    EXPECT_EQ(Raised("class A:\n    pass\nA().missing\n").TypeName(), "AttributeError");
    EXPECT_EQ(Raised("class L(list):\n    pass\n").Message(), "subclassing built-in type 'list' is not supported");
    EXPECT_EQ(Raised("class A:\n    def __init__(self):\n        return 1\nA()\n").TypeName(), "TypeError");
    EXPECT_EQ(Raised("class E(ValueError):\n    x = 1\n").TypeName(), "TypeError");
    EXPECT_EQ(Raised("class A:\n    def __eq__(self, other):\n        return True\ns = {A()}\n").TypeName(),
              "TypeError");
}

TEST_F(InterpreterTest, FrozensetAndSliceObjects) {
    EXPECT_EQ(ReprOf("f = frozenset([3, 1, 3])\n"
                     "result = (len(f), f == {1, 3}, {f: 'key'}[frozenset({1, 3})], repr(frozenset()),\n"
                     "          isinstance(f, frozenset), isinstance(f, set), sorted(f | {2}))\n"),
              "(2, True, 'key', 'frozenset()', True, False, [1, 2, 3])");
    EXPECT_EQ(ReprOf("result = repr(frozenset([1]).union([2]))"), "'frozenset({1, 2})'");
    EXPECT_EQ(Raised("f = frozenset()\nf.add(1)\n").TypeName(), "AttributeError");
    EXPECT_EQ(ReprOf("s = slice(1, None, 2)\n"
                     "result = ('abcdef'[s], [0, 1, 2, 3][slice(2)], repr(s), s.start, s.stop, s.step)\n"),
              "('bdf', [0, 1], 'slice(1, None, 2)', 1, None, 2)");
}

TEST_F(InterpreterTest, ReferenceCyclesDieWithTheInterpreter) {
    Run("x = []\n"
        "x.append(x)\n"
        "d = {}\n"
        "d['self'] = d\n"
        "class Node:\n"
        "    def __init__(self):\n"
        "        self.me = self\n"
        "n = Node()\n");
    std::weak_ptr<ListObject> list = Global("x").AsList();
    std::weak_ptr<DictObject> dict = Global("d").AsDict();
    std::weak_ptr<InstanceObject> node = Global("n").AsInstance();
    ASSERT_FALSE(list.expired());
    interpreter_.reset();
    EXPECT_TRUE(list.expired());
    EXPECT_TRUE(dict.expired());
    EXPECT_TRUE(node.expired());
}

TEST_F(InterpreterTest, ExportedResultsOutliveTheInterpreter) {
    Run("class P:\n"
        "    def __repr__(self):\n"
        "        return 'P!'\n"
        "x = [1]\n"
        "x.append(x)\n"
        "result = [P(), {'k': (1, 2)}]\n");
    const Value exported = interpreter_->Export(Global("result"));
    interpreter_.reset();
    ASSERT_EQ(exported.kind(), ValueKind::kList);
    const auto& items = exported.AsList()->items;
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].kind(), ValueKind::kOpaque);
    EXPECT_EQ(Repr(items[0]), "P!");
    EXPECT_EQ(TypeName(items[0]), "P");
    EXPECT_EQ(Repr(items[1]), "{'k': (1, 2)}");
}

}  // namespace
}  // namespace evalbox::lang
