#pragma once

#include <memory>
#include <string>
#include <vector>

#include "lang/ast.hpp"
#include "lang/lexer.hpp"

namespace evalbox::lang {

// Recursive descent parser for the supported Python subset. Besides building
// the tree it resolves, per function, which names are local, global or
// nonlocal, and rejects constructs the interpreter does not run (generators,
// context managers, decorators) with an UnsupportedFeature error.
class Parser {
public:
    explicit Parser(std::vector<Token> tokens);

    // Throws SyntaxError.
    std::unique_ptr<Program> ParseProgram();
    ExprPtr ParseStandaloneExpression();

private:
    struct NestingGuard;

    const Token& Peek(std::size_t offset = 0) const;
    const Token& Advance();
    bool IsOp(const std::string& text, std::size_t offset = 0) const;
    bool IsKeyword(const std::string& text, std::size_t offset = 0) const;
    bool MatchOp(const std::string& text);
    bool MatchKeyword(const std::string& text);
    const Token& ExpectOp(const std::string& text, const std::string& message = "");
    void ExpectKeyword(const std::string& text);
    std::string ExpectName();
    [[noreturn]] void Fail(const std::string& message, const Token& token) const;
    [[noreturn]] void Fail(const std::string& message, int line, int column) const;
    [[noreturn]] void FailIndent(const std::string& message, const Token& token) const;
    [[noreturn]] void Unsupported(const std::string& message, const Token& token) const;
    // Innermost function being parsed; null at module level and directly in a class body.
    FunctionDef* EnclosingFunction() const;
    bool CanStartExpression(const Token& token) const;

    // Statements
    void ParseStatement(std::vector<StmtPtr>& out);
    void ParseSimpleStatements(std::vector<StmtPtr>& out);
    StmtPtr ParseSmallStatement();
    std::vector<StmtPtr> ParseBlock(const std::string& after, int header_line);
    StmtPtr ParseIf();
    StmtPtr ParseWhile();
    StmtPtr ParseFor();
    StmtPtr ParseFunctionDef();
    StmtPtr ParseClassDef();
    StmtPtr ParseTry();
    StmtPtr ParseImport();
    StmtPtr ParseExpressionStatement();
    void ParseParameters(FunctionDef& def, const std::string& closer, bool allow_annotations);

    // Expressions
    ExprPtr ParseTestListStarExpr();
    ExprPtr ParseTestOrStar();
    ExprPtr ParseTest();
    ExprPtr ParseLambda();
    ExprPtr ParseOrTest();
    ExprPtr ParseAndTest();
    ExprPtr ParseNotTest();
    ExprPtr ParseComparison();
    ExprPtr ParseBitOr();
    ExprPtr ParseBitXor();
    ExprPtr ParseBitAnd();
    ExprPtr ParseShift();
    ExprPtr ParseArith();
    ExprPtr ParseTerm();
    ExprPtr ParseFactor();
    ExprPtr ParsePower();
    ExprPtr ParseAtomExpr();
    ExprPtr ParseAtom();
    ExprPtr ParseParenthesized(const Token& open);
    ExprPtr ParseListDisplay(const Token& open);
    ExprPtr ParseBraceDisplay(const Token& open);
    ExprPtr ParseStrings();
    ExprPtr ParseCall(ExprPtr callee, const Token& open);
    ExprPtr ParseSubscript(ExprPtr object, const Token& open);
    ExprPtr ParseSliceItem();
    ExprPtr ParseExprList();
    std::vector<Comprehension> ParseComprehensionClauses();
    void ParseFStringBody(const Token& token, std::vector<FStringPart>& parts);

    // Assignment targets and scope bookkeeping
    void ValidateTarget(const Expr& target, bool record, bool allow_starred);
    void RecordStore(const std::string& name);
    void FinishFunction(FunctionDef& def);

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    int nesting_ = 0;
    int block_depth_ = 0;
    int loop_depth_ = 0;
    // Enclosing function definitions; null entries mark class bodies.
    std::vector<FunctionDef*> functions_;
};

// Tokenizes and parses a whole module.
std::unique_ptr<Program> ParseSource(const std::string& source);

}  // namespace evalbox::lang
