#include <gtest/gtest.h>

#include "lang/lexer.hpp"
#include "lang/parser.hpp"
#include "lang/script_error.hpp"

namespace evalbox::lang {
namespace {

SyntaxError ParseFailure(const std::string& source) {
    try {
        ParseSource(source);
    } catch (const SyntaxError& ex) {
        return ex;
    }
    ADD_FAILURE() << "expected a syntax error for:\n" << source;
    return SyntaxError("SyntaxError", "", 0, 0);
}

TEST(LexerTest, TracksIndentation) {
    const auto tokens = Lexer("def f():\n    return 1\n").Tokenize();
    int indents = 0;
    int dedents = 0;
    for (const auto& token : tokens) {
        indents += token.type == TokenType::kIndent;
        dedents += token.type == TokenType::kDedent;
    }
    EXPECT_EQ(indents, 1);
    EXPECT_EQ(dedents, 1);
    EXPECT_EQ(tokens.back().type, TokenType::kEnd);
}

TEST(LexerTest, DecodesLiterals) {
    const auto tokens = Lexer("x = 0x1f + 2.5 + 'a\\tb'\n").Tokenize();
    ASSERT_GE(tokens.size(), 7u);
    EXPECT_EQ(tokens[2].type, TokenType::kInt);
    EXPECT_EQ(tokens[2].int_value, 31);
    EXPECT_EQ(tokens[4].type, TokenType::kFloat);
    EXPECT_DOUBLE_EQ(tokens[4].float_value, 2.5);
    EXPECT_EQ(tokens[6].type, TokenType::kString);
    EXPECT_EQ(tokens[6].text, "a\tb");
}

TEST(LexerTest, IgnoresNewlinesInsideBrackets) {
    const auto tokens = Lexer("x = [1,\n     2]\n").Tokenize();
    int newlines = 0;
    for (const auto& token : tokens) {
        newlines += token.type == TokenType::kNewline;
    }
    EXPECT_EQ(newlines, 1);
}

TEST(LexerTest, UnterminatedStringReportsLine) {
    const auto error = ParseFailure("x = 1\ny = 'abc\n");
    EXPECT_EQ(error.kind(), "SyntaxError");
    EXPECT_EQ(error.line(), 2);
    EXPECT_NE(error.message().find("unterminated string literal"), std::string::npos);
}

TEST(ParserTest, ParsesFunctionDefinition) {
    const auto program = ParseSource("def add(a, b=2, *rest):\n    total = a + b\n    return total\n");
    ASSERT_EQ(program->body.size(), 1u);
    const auto& stmt = *program->body[0];
    ASSERT_EQ(stmt.kind, StmtKind::kFunctionDef);
    const auto& def = *stmt.function;
    EXPECT_EQ(def.name, "add");
    EXPECT_EQ(def.params, (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(def.defaults.size(), 1u);
    EXPECT_EQ(def.vararg, "rest");
    EXPECT_EQ(def.body.size(), 2u);
    EXPECT_TRUE(def.local_names.count("total"));
}

TEST(ParserTest, RecordsGlobalAndNonlocalNames) {
    const auto program = ParseSource(
        "count = 0\n"
        "def outer():\n"
        "    x = 1\n"
        "    def inner():\n"
        "        nonlocal x\n"
        "        global count\n"
        "        x += 1\n"
        "        count += 1\n"
        "    return inner\n");
    const auto& outer = *program->body[1]->function;
    const auto& inner = *outer.body[1]->function;
    EXPECT_TRUE(inner.nonlocal_names.count("x"));
    EXPECT_TRUE(inner.global_names.count("count"));
    EXPECT_FALSE(inner.local_names.count("x"));
}

TEST(ParserTest, MissingColonIsSyntaxError) {
    const auto error = ParseFailure("def f(x)\n    return x\n");
    EXPECT_EQ(error.kind(), "SyntaxError");
    EXPECT_EQ(error.line(), 1);
    EXPECT_GT(error.column(), 0);
}

TEST(ParserTest, MissingBodyIsIndentationError) {
    const auto error = ParseFailure("def f():\nreturn 1\n");
    EXPECT_EQ(error.kind(), "IndentationError");
    EXPECT_EQ(error.line(), 2);
    EXPECT_EQ(error.message(), "expected an indented block after function definition on line 1");
}

TEST(ParserTest, UnexpectedIndent) {
    const auto error = ParseFailure("x = 1\n    y = 2\n");
    EXPECT_EQ(error.kind(), "IndentationError");
    EXPECT_EQ(error.message(), "unexpected indent");
    EXPECT_EQ(error.line(), 2);
}

TEST(ParserTest, InconsistentDedent) {
    const auto error = ParseFailure("def f():\n        x = 1\n    return x\n");
    EXPECT_EQ(error.kind(), "IndentationError");
    EXPECT_EQ(error.line(), 3);
}

TEST(ParserTest, RejectsUnsupportedConstructs) {
    EXPECT_NE(ParseFailure("def g():\n    yield 1\n").message().find("generators"), std::string::npos);
    EXPECT_NE(ParseFailure("with x:\n    pass\n").message().find("'with'"), std::string::npos);
    EXPECT_NE(ParseFailure("@d\ndef f():\n    pass\n").message().find("decorators"), std::string::npos);
    EXPECT_NE(ParseFailure("class A(metaclass=M):\n    pass\n").message().find("metaclass"), std::string::npos);
}

TEST(ParserTest, UnsupportedConstructsHaveTheirOwnKind) {
    const auto error = ParseFailure("x = 1\nwith x:\n    pass\n");
    EXPECT_EQ(error.kind(), "UnsupportedFeature");
    EXPECT_EQ(error.line(), 2);
    EXPECT_EQ(ParseFailure("def f(**kw):\n    pass\n").kind(), "UnsupportedFeature");
    EXPECT_EQ(ParseFailure("def f(:\n    pass\n").kind(), "SyntaxError");
}

TEST(ParserTest, ParsesClassDefinition) {
    const auto program = ParseSource(
        "class Stack(Base):\n"
        "    \"LIFO container.\"\n"
        "    limit = 10\n"
        "    def push(self, item):\n"
        "        self.items.append(item)\n");
    ASSERT_EQ(program->body.size(), 1u);
    const auto& stmt = *program->body[0];
    ASSERT_EQ(stmt.kind, StmtKind::kClassDef);
    const auto& def = *stmt.class_def;
    EXPECT_EQ(def.name, "Stack");
    ASSERT_EQ(def.bases.size(), 1u);
    EXPECT_EQ(def.bases[0]->name, "Base");
    ASSERT_EQ(def.body.size(), 3u);
    EXPECT_EQ(def.body[2]->kind, StmtKind::kFunctionDef);
    EXPECT_EQ(def.body[2]->function->params, (std::vector<std::string>{"self", "item"}));
}

TEST(ParserTest, ClassBodyIsNotAFunction) {
    EXPECT_EQ(ParseFailure("class A:\n    return 1\n").message(), "'return' outside function");
    EXPECT_EQ(ParseFailure("class A:\n    global x\n").kind(), "UnsupportedFeature");
}

TEST(ParserTest, ReturnOutsideFunction) {
    const auto error = ParseFailure("return 5\n");
    EXPECT_EQ(error.message(), "'return' outside function");
}

TEST(ParserTest, InvalidAssignmentTarget) {
    const auto error = ParseFailure("f() = 3\n");
    EXPECT_NE(error.message().find("cannot assign to function call"), std::string::npos);
}

TEST(ParserTest, ImportIsParsedForTheChecker) {
    const auto program = ParseSource("import math\n");
    ASSERT_EQ(program->body.size(), 1u);
    EXPECT_EQ(program->body[0]->kind, StmtKind::kImport);
    EXPECT_EQ(program->body[0]->names.front(), "math");
}

TEST(ParserTest, FStringParts) {
    const auto program = ParseSource("s = f'{a!r:>5} and {b}'\n");
    const auto& value = *program->body[0]->value;
    ASSERT_EQ(value.kind, ExprKind::kFString);
    ASSERT_GE(value.fstring_parts.size(), 2u);
    EXPECT_EQ(value.fstring_parts[0].conversion, 'r');
    EXPECT_EQ(value.fstring_parts[0].format_spec, ">5");
}

}  // namespace
}  // namespace evalbox::lang
