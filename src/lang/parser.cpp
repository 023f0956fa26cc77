#include "lang/parser.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "lang/script_error.hpp"

namespace evalbox::lang {
namespace {

constexpr int kMaxExpressionNesting = 200;
constexpr int kMaxBlockNesting = 100;

const std::unordered_set<std::string>& Keywords() {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None",   "True",    "and",      "as",       "assert", "async", "await",
        "break", "class",  "continue", "def",     "del",      "elif",   "else",  "except",
        "finally", "for",  "from",    "global",   "if",       "import", "in",    "is",
        "lambda", "nonlocal", "not",  "or",       "pass",     "raise",  "return", "try",
        "while", "with",   "yield"};
    return kKeywords;
}

bool IsReserved(const Token& token) {
    return token.type == TokenType::kName && Keywords().count(token.text) > 0;
}

const std::unordered_map<std::string, BinaryOperator>& AugmentedOperators() {
    static const std::unordered_map<std::string, BinaryOperator> kOperators = {
        {"+=", BinaryOperator::kAdd},     {"-=", BinaryOperator::kSub},      {"*=", BinaryOperator::kMul},
        {"/=", BinaryOperator::kDiv},     {"//=", BinaryOperator::kFloorDiv}, {"%=", BinaryOperator::kMod},
        {"**=", BinaryOperator::kPow},    {"<<=", BinaryOperator::kLShift},   {">>=", BinaryOperator::kRShift},
        {"|=", BinaryOperator::kBitOr},   {"^=", BinaryOperator::kBitXor},    {"&=", BinaryOperator::kBitAnd}};
    return kOperators;
}

ExprPtr MakeExpr(ExprKind kind, int line, int column) {
    auto expr = std::make_unique<Expr>();
    expr->kind = kind;
    expr->line = line;
    expr->column = column;
    return expr;
}

ExprPtr MakeExpr(ExprKind kind, const Token& token) {
    return MakeExpr(kind, token.line, token.column);
}

StmtPtr MakeStmt(StmtKind kind, const Token& token) {
    auto stmt = std::make_unique<Stmt>();
    stmt->kind = kind;
    stmt->line = token.line;
    stmt->column = token.column;
    return stmt;
}

ExprPtr MakeBinary(BinaryOperator op, ExprPtr lhs, ExprPtr rhs) {
    auto expr = MakeExpr(ExprKind::kBinaryOp, lhs->line, lhs->column);
    expr->binary_op = op;
    expr->children.push_back(std::move(lhs));
    expr->children.push_back(std::move(rhs));
    return expr;
}

std::string TrimRight(const std::string& text) {
    const auto end = text.find_last_not_of(" \t\n");
    return end == std::string::npos ? "" : text.substr(0, end + 1);
}

void AppendLiteral(std::vector<FStringPart>& parts, const std::string& text) {
    if (text.empty()) {
        return;
    }
    if (!parts.empty() && !parts.back().expr) {
        parts.back().literal += text;
        return;
    }
    FStringPart part;
    part.literal = text;
    parts.push_back(std::move(part));
}

}  // namespace

struct Parser::NestingGuard {
    NestingGuard(Parser& parser, const Token& token) : parser_(parser) {
        if (++parser_.nesting_ > kMaxExpressionNesting) {
            parser_.Fail("too many nested parentheses", token);
        }
    }
    ~NestingGuard() { --parser_.nesting_; }

    NestingGuard(const NestingGuard&) = delete;
    NestingGuard& operator=(const NestingGuard&) = delete;

private:
    Parser& parser_;
};

Parser::Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {
    if (tokens_.empty() || tokens_.back().type != TokenType::kEnd) {
        Token end;
        end.type = TokenType::kEnd;
        if (!tokens_.empty()) {
            end.line = tokens_.back().line;
        }
        tokens_.push_back(end);
    }
}

const Token& Parser::Peek(std::size_t offset) const {
    const std::size_t index = pos_ + offset;
    return index < tokens_.size() ? tokens_[index] : tokens_.back();
}

const Token& Parser::Advance() {
    const Token& token = tokens_[pos_];
    if (pos_ + 1 < tokens_.size()) {
        ++pos_;
    }
    return token;
}

bool Parser::IsOp(const std::string& text, std::size_t offset) const {
    const Token& token = Peek(offset);
    return token.type == TokenType::kOp && token.text == text;
}

bool Parser::IsKeyword(const std::string& text, std::size_t offset) const {
    const Token& token = Peek(offset);
    return token.type == TokenType::kName && token.text == text;
}

bool Parser::MatchOp(const std::string& text) {
    if (!IsOp(text)) {
        return false;
    }
    Advance();
    return true;
}

bool Parser::MatchKeyword(const std::string& text) {
    if (!IsKeyword(text)) {
        return false;
    }
    Advance();
    return true;
}

const Token& Parser::ExpectOp(const std::string& text, const std::string& message) {
    if (!IsOp(text)) {
        Fail(message.empty() ? "invalid syntax" : message, Peek());
    }
    return Advance();
}

void Parser::ExpectKeyword(const std::string& text) {
    if (!IsKeyword(text)) {
        Fail("invalid syntax", Peek());
    }
    Advance();
}

std::string Parser::ExpectName() {
    const Token& token = Peek();
    if (token.type != TokenType::kName || IsReserved(token)) {
        Fail("invalid syntax", token);
    }
    Advance();
    return token.text;
}

void Parser::Fail(const std::string& message, const Token& token) const {
    Fail(message, token.line, token.column);
}

void Parser::Fail(const std::string& message, int line, int column) const {
    throw SyntaxError("SyntaxError", message, line, column);
}

void Parser::FailIndent(const std::string& message, const Token& token) const {
    throw SyntaxError("IndentationError", message, token.line, token.column);
}

void Parser::Unsupported(const std::string& message, const Token& token) const {
    throw SyntaxError("UnsupportedFeature", message, token.line, token.column);
}

FunctionDef* Parser::EnclosingFunction() const {
    return functions_.empty() ? nullptr : functions_.back();
}

bool Parser::CanStartExpression(const Token& token) const {
    switch (token.type) {
        case TokenType::kInt:
        case TokenType::kFloat:
        case TokenType::kString:
        case TokenType::kFString:
            return true;
        case TokenType::kName:
            return !IsReserved(token) || token.text == "True" || token.text == "False" ||
                   token.text == "None" || token.text == "not" || token.text == "lambda";
        case TokenType::kOp:
            return token.text == "(" || token.text == "[" || token.text == "{" || token.text == "-" ||
                   token.text == "+" || token.text == "~" || token.text == "*";
        default:
            return false;
    }
}

std::unique_ptr<Program> Parser::ParseProgram() {
    auto program = std::make_unique<Program>();
    while (Peek().type != TokenType::kEnd) {
        if (Peek().type == TokenType::kNewline) {
            Advance();
            continue;
        }
        if (Peek().type == TokenType::kDedent) {
            FailIndent("unindent does not match any outer indentation level", Peek());
        }
        ParseStatement(program->body);
    }
    return program;
}

ExprPtr Parser::ParseStandaloneExpression() {
    auto expr = ParseTestListStarExpr();
    if (Peek().type != TokenType::kEnd) {
        Fail("f-string: invalid syntax", Peek());
    }
    return expr;
}

// ---------------------------------------------------------------------------
// Statements

void Parser::ParseStatement(std::vector<StmtPtr>& out) {
    const Token& token = Peek();
    if (token.type == TokenType::kIndent) {
        FailIndent("unexpected indent", token);
    }
    if (token.type == TokenType::kName) {
        if (token.text == "if") {
            out.push_back(ParseIf());
            return;
        }
        if (token.text == "while") {
            out.push_back(ParseWhile());
            return;
        }
        if (token.text == "for") {
            out.push_back(ParseFor());
            return;
        }
        if (token.text == "def") {
            out.push_back(ParseFunctionDef());
            return;
        }
        if (token.text == "try") {
            out.push_back(ParseTry());
            return;
        }
        if (token.text == "class") {
            out.push_back(ParseClassDef());
            return;
        }
        if (token.text == "with") {
            Unsupported("'with' statements are not supported", token);
        }
        if (token.text == "async") {
            Unsupported("async functions are not supported", token);
        }
    }
    if (IsOp("@")) {
        Unsupported("decorators are not supported", token);
    }
    ParseSimpleStatements(out);
}

void Parser::ParseSimpleStatements(std::vector<StmtPtr>& out) {
    while (true) {
        out.push_back(ParseSmallStatement());
        if (!MatchOp(";")) {
            break;
        }
        if (Peek().type == TokenType::kNewline) {
            break;
        }
    }
    if (Peek().type != TokenType::kNewline) {
        Fail("invalid syntax", Peek());
    }
    Advance();
}

std::vector<StmtPtr> Parser::ParseBlock(const std::string& after, int header_line) {
    ExpectOp(":", "expected ':'");
    std::vector<StmtPtr> body;
    if (Peek().type != TokenType::kNewline) {
        ParseSimpleStatements(body);
        return body;
    }
    Advance();
    if (Peek().type != TokenType::kIndent) {
        FailIndent("expected an indented block after " + after + " on line " + std::to_string(header_line),
                   Peek());
    }
    Advance();
    if (++block_depth_ > kMaxBlockNesting) {
        Fail("too many statically nested blocks", Peek());
    }
    while (Peek().type != TokenType::kDedent && Peek().type != TokenType::kEnd) {
        ParseStatement(body);
    }
    --block_depth_;
    if (Peek().type == TokenType::kDedent) {
        Advance();
    }
    return body;
}

StmtPtr Parser::ParseIf() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kIf, keyword);
    stmt->test = ParseTest();
    stmt->body = ParseBlock("'" + keyword.text + "' statement", keyword.line);
    if (IsKeyword("elif")) {
        stmt->orelse.push_back(ParseIf());
    } else if (IsKeyword("else")) {
        const Token& other = Advance();
        stmt->orelse = ParseBlock("'else' statement", other.line);
    }
    return stmt;
}

StmtPtr Parser::ParseWhile() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kWhile, keyword);
    stmt->test = ParseTest();
    ++loop_depth_;
    stmt->body = ParseBlock("'while' statement", keyword.line);
    --loop_depth_;
    if (IsKeyword("else")) {
        const Token& other = Advance();
        stmt->orelse = ParseBlock("'else' statement", other.line);
    }
    return stmt;
}

StmtPtr Parser::ParseFor() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kFor, keyword);
    stmt->target = ParseExprList();
    ValidateTarget(*stmt->target, true, false);
    ExpectKeyword("in");
    stmt->value = ParseTestListStarExpr();
    ++loop_depth_;
    stmt->body = ParseBlock("'for' statement", keyword.line);
    --loop_depth_;
    if (IsKeyword("else")) {
        const Token& other = Advance();
        stmt->orelse = ParseBlock("'else' statement", other.line);
    }
    return stmt;
}

StmtPtr Parser::ParseFunctionDef() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kFunctionDef, keyword);
    auto def = std::make_shared<FunctionDef>();
    def->name = ExpectName();
    def->line = keyword.line;
    RecordStore(def->name);

    ExpectOp("(", "expected '('");
    ParseParameters(*def, ")", true);
    if (MatchOp("->")) {
        ParseTest();
    }

    functions_.push_back(def.get());
    const int saved_loop_depth = loop_depth_;
    loop_depth_ = 0;
    def->local_names.insert(def->params.begin(), def->params.end());
    if (!def->vararg.empty()) {
        def->local_names.insert(def->vararg);
    }
    def->body = ParseBlock("function definition", keyword.line);
    loop_depth_ = saved_loop_depth;
    functions_.pop_back();

    FinishFunction(*def);
    stmt->function = std::move(def);
    return stmt;
}

StmtPtr Parser::ParseClassDef() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kClassDef, keyword);
    auto def = std::make_shared<ClassDef>();
    def->name = ExpectName();
    def->line = keyword.line;
    RecordStore(def->name);

    if (MatchOp("(")) {
        while (!IsOp(")")) {
            const Token& token = Peek();
            if (IsOp("*") || IsOp("**")) {
                Unsupported("unpacking in a class bases list is not supported", token);
            }
            if (token.type == TokenType::kName && IsOp("=", 1)) {
                Unsupported("class keyword arguments (metaclass=...) are not supported", token);
            }
            def->bases.push_back(ParseTest());
            if (!MatchOp(",")) {
                break;
            }
        }
        ExpectOp(")");
    }

    // A class body is not a function scope: its names stay out of any
    // enclosing function's locals.
    functions_.push_back(nullptr);
    const int saved_loop_depth = loop_depth_;
    loop_depth_ = 0;
    def->body = ParseBlock("class definition", keyword.line);
    loop_depth_ = saved_loop_depth;
    functions_.pop_back();

    stmt->class_def = std::move(def);
    return stmt;
}

void Parser::ParseParameters(FunctionDef& def, const std::string& closer, bool allow_annotations) {
    bool seen_default = false;
    bool seen_star = false;
    std::unordered_set<std::string> seen;
    auto declare = [&](const std::string& name, const Token& token) {
        if (!seen.insert(name).second) {
            Fail("duplicate argument '" + name + "' in function definition", token);
        }
    };
    while (!IsOp(closer)) {
        const Token& token = Peek();
        if (IsOp("**")) {
            Unsupported("keyword argument packing (**kwargs) is not supported", token);
        }
        if (MatchOp("/")) {
            // Positional-only marker; every parameter is positional here anyway.
        } else if (MatchOp("*")) {
            if (seen_star) {
                Fail("* argument may appear only once", token);
            }
            seen_star = true;
            if (Peek().type != TokenType::kName || IsReserved(Peek())) {
                Unsupported("keyword-only parameters are not supported", token);
            }
            def.vararg = ExpectName();
            declare(def.vararg, token);
            if (allow_annotations && MatchOp(":")) {
                ParseTest();
            }
        } else {
            if (seen_star) {
                Unsupported("keyword-only parameters are not supported", token);
            }
            const std::string param = ExpectName();
            declare(param, token);
            if (allow_annotations && MatchOp(":")) {
                ParseTest();
            }
            if (MatchOp("=")) {
                def.defaults.push_back(ParseTest());
                seen_default = true;
            } else if (seen_default) {
                Fail("parameter without a default follows parameter with a default", token);
            }
            def.params.push_back(param);
        }
        if (!MatchOp(",")) {
            break;
        }
    }
    ExpectOp(closer, closer == ":" ? "expected ':'" : "invalid syntax");
}

StmtPtr Parser::ParseTry() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kTry, keyword);
    stmt->body = ParseBlock("'try' statement", keyword.line);

    bool bare_seen = false;
    while (IsKeyword("except")) {
        const Token& except = Advance();
        if (bare_seen) {
            Fail("default 'except:' must be last", except);
        }
        if (IsOp("*")) {
            Unsupported("'except*' is not supported", except);
        }
        ExceptHandler handler;
        handler.line = except.line;
        if (IsOp(":")) {
            bare_seen = true;
        } else {
            handler.type = ParseTest();
            if (MatchKeyword("as")) {
                handler.name = ExpectName();
                RecordStore(handler.name);
            }
        }
        handler.body = ParseBlock("'except' statement", except.line);
        stmt->handlers.push_back(std::move(handler));
    }

    if (IsKeyword("else")) {
        const Token& other = Advance();
        if (stmt->handlers.empty()) {
            Fail("expected 'except' or 'finally' block", other);
        }
        stmt->orelse = ParseBlock("'else' statement", other.line);
    }
    bool has_finally = false;
    if (IsKeyword("finally")) {
        const Token& other = Advance();
        has_finally = true;
        stmt->finalbody = ParseBlock("'finally' statement", other.line);
    }
    if (stmt->handlers.empty() && !has_finally) {
        Fail("expected 'except' or 'finally' block", Peek());
    }
    return stmt;
}

StmtPtr Parser::ParseImport() {
    const Token& keyword = Advance();
    auto stmt = MakeStmt(StmtKind::kImport, keyword);
    auto dotted_name = [this]() {
        std::string name = ExpectName();
        while (MatchOp(".")) {
            name += "." + ExpectName();
        }
        return name;
    };

    if (keyword.text == "import") {
        do {
            const std::string module = dotted_name();
            stmt->names.push_back(module);
            if (MatchKeyword("as")) {
                RecordStore(ExpectName());
            } else {
                RecordStore(module.substr(0, module.find('.')));
            }
        } while (MatchOp(","));
        return stmt;
    }

    std::string module;
    while (IsOp(".") || IsOp("...")) {
        module += Advance().text;
    }
    if (!IsKeyword("import")) {
        module += dotted_name();
    }
    stmt->names.push_back(module);
    ExpectKeyword("import");
    if (MatchOp("*")) {
        return stmt;
    }
    const bool parenthesized = MatchOp("(");
    do {
        if (parenthesized && IsOp(")")) {
            break;
        }
        std::string alias = ExpectName();
        if (MatchKeyword("as")) {
            alias = ExpectName();
        }
        RecordStore(alias);
    } while (MatchOp(","));
    if (parenthesized) {
        ExpectOp(")");
    }
    return stmt;
}

StmtPtr Parser::ParseSmallStatement() {
    const Token& token = Peek();
    if (token.type == TokenType::kName && IsReserved(token)) {
        const std::string& word = token.text;
        if (word == "pass") {
            Advance();
            return MakeStmt(StmtKind::kPass, token);
        }
        if (word == "break" || word == "continue") {
            Advance();
            if (loop_depth_ == 0) {
                Fail(word == "break" ? "'break' outside loop" : "'continue' not properly in loop", token);
            }
            return MakeStmt(word == "break" ? StmtKind::kBreak : StmtKind::kContinue, token);
        }
        if (word == "return") {
            Advance();
            if (EnclosingFunction() == nullptr) {
                Fail("'return' outside function", token);
            }
            auto stmt = MakeStmt(StmtKind::kReturn, token);
            if (CanStartExpression(Peek())) {
                stmt->value = ParseTestListStarExpr();
                if (stmt->value->kind == ExprKind::kStarred) {
                    Fail("can't use starred expression here", token);
                }
            }
            return stmt;
        }
        if (word == "raise") {
            Advance();
            auto stmt = MakeStmt(StmtKind::kRaise, token);
            if (CanStartExpression(Peek())) {
                stmt->value = ParseTest();
                if (MatchKeyword("from")) {
                    stmt->cause = ParseTest();
                }
            }
            return stmt;
        }
        if (word == "global" || word == "nonlocal") {
            Advance();
            const bool global = word == "global";
            auto stmt = MakeStmt(global ? StmtKind::kGlobal : StmtKind::kNonlocal, token);
            if (!global && functions_.empty()) {
                Fail("nonlocal declaration not allowed at module level", token);
            }
            if (!functions_.empty() && EnclosingFunction() == nullptr) {
                Unsupported(word + " declarations in a class body are not supported", token);
            }
            do {
                const Token& name_token = Peek();
                const std::string name = ExpectName();
                stmt->names.push_back(name);
                if (functions_.empty()) {
                    continue;
                }
                FunctionDef& def = *functions_.back();
                for (const auto& param : def.params) {
                    if (param == name) {
                        Fail("name '" + name + "' is parameter and " + word, name_token);
                    }
                }
                if (def.local_names.count(name) > 0) {
                    Fail("name '" + name + "' is assigned to before " + word + " declaration", name_token);
                }
                if (global) {
                    def.global_names.insert(name);
                } else {
                    const auto enclosing = std::count_if(functions_.begin(), functions_.end() - 1,
                                                         [](const FunctionDef* outer) { return outer != nullptr; });
                    if (enclosing == 0) {
                        Fail("no binding for nonlocal '" + name + "' found", name_token);
                    }
                    def.nonlocal_names.insert(name);
                }
            } while (MatchOp(","));
            return stmt;
        }
        if (word == "del") {
            Advance();
            auto stmt = MakeStmt(StmtKind::kDelete, token);
            auto targets = ParseExprList();
            ValidateTarget(*targets, true, false);
            stmt->targets.push_back(std::move(targets));
            return stmt;
        }
        if (word == "assert") {
            Advance();
            auto stmt = MakeStmt(StmtKind::kAssert, token);
            stmt->test = ParseTest();
            if (MatchOp(",")) {
                stmt->value = ParseTest();
            }
            return stmt;
        }
        if (word == "import" || word == "from") {
            return ParseImport();
        }
        if (word == "yield") {
            Unsupported("generators ('yield') are not supported", token);
        }
        if (word == "await") {
            Unsupported("'await' is not supported", token);
        }
    }
    return ParseExpressionStatement();
}

StmtPtr Parser::ParseExpressionStatement() {
    const Token& start = Peek();
    auto first = ParseTestListStarExpr();

    if (IsOp(":")) {
        if (first->kind != ExprKind::kName && first->kind != ExprKind::kAttribute &&
            first->kind != ExprKind::kSubscript) {
            Fail("illegal target for annotation", start);
        }
        Advance();
        ParseTest();
        ValidateTarget(*first, true, false);
        if (!MatchOp("=")) {
            return MakeStmt(StmtKind::kPass, start);
        }
        auto stmt = MakeStmt(StmtKind::kAssign, start);
        stmt->targets.push_back(std::move(first));
        stmt->value = ParseTestListStarExpr();
        return stmt;
    }

    if (Peek().type == TokenType::kOp) {
        const auto& augmented = AugmentedOperators();
        const auto it = augmented.find(Peek().text);
        if (it != augmented.end()) {
            if (first->kind != ExprKind::kName && first->kind != ExprKind::kAttribute &&
                first->kind != ExprKind::kSubscript) {
                Fail("illegal expression for augmented assignment", start);
            }
            Advance();
            ValidateTarget(*first, true, false);
            auto stmt = MakeStmt(StmtKind::kAugAssign, start);
            stmt->binary_op = it->second;
            stmt->target = std::move(first);
            if (IsKeyword("yield")) {
                Unsupported("generators ('yield') are not supported", Peek());
            }
            stmt->value = ParseTestListStarExpr();
            return stmt;
        }
    }

    if (IsOp("=")) {
        auto stmt = MakeStmt(StmtKind::kAssign, start);
        ExprPtr pending = std::move(first);
        while (MatchOp("=")) {
            ValidateTarget(*pending, true, false);
            stmt->targets.push_back(std::move(pending));
            if (IsKeyword("yield")) {
                Unsupported("generators ('yield') are not supported", Peek());
            }
            pending = ParseTestListStarExpr();
        }
        stmt->value = std::move(pending);
        return stmt;
    }

    if (IsOp(":=")) {
        Unsupported("assignment expressions (':=') are not supported", Peek());
    }
    if (first->kind == ExprKind::kStarred) {
        Fail("can't use starred expression here", start);
    }
    auto stmt = MakeStmt(StmtKind::kExpr, start);
    stmt->value = std::move(first);
    return stmt;
}

// ---------------------------------------------------------------------------
// Scope bookkeeping

void Parser::ValidateTarget(const Expr& target, bool record, bool allow_starred) {
    switch (target.kind) {
        case ExprKind::kName:
            if (record) {
                RecordStore(target.name);
            }
            return;
        case ExprKind::kAttribute:
        case ExprKind::kSubscript:
            return;
        case ExprKind::kTuple:
        case ExprKind::kList: {
            int starred = 0;
            for (const auto& child : target.children) {
                if (child->kind == ExprKind::kStarred) {
                    if (++starred > 1) {
                        Fail("multiple starred expressions in assignment", child->line, child->column);
                    }
                    ValidateTarget(*child->children[0], record, false);
                } else {
                    ValidateTarget(*child, record, false);
                }
            }
            return;
        }
        case ExprKind::kStarred:
            if (!allow_starred) {
                Fail("starred assignment target must be in a list or tuple", target.line, target.column);
            }
            ValidateTarget(*target.children[0], record, false);
            return;
        case ExprKind::kConstant:
            if (target.constant.IsNone() || target.constant.IsBool()) {
                Fail("cannot assign to " + Repr(target.constant), target.line, target.column);
            }
            Fail("cannot assign to literal here. Maybe you meant '==' instead of '='?", target.line,
                 target.column);
        case ExprKind::kCall:
            Fail("cannot assign to function call here. Maybe you meant '==' instead of '='?", target.line,
                 target.column);
        default:
            Fail("cannot assign to expression here. Maybe you meant '==' instead of '='?", target.line,
                 target.column);
    }
}

void Parser::RecordStore(const std::string& name) {
    if (FunctionDef* def = EnclosingFunction()) {
        def->local_names.insert(name);
    }
}

void Parser::FinishFunction(FunctionDef& def) {
    for (const auto& name : def.global_names) {
        def.local_names.erase(name);
    }
    for (const auto& name : def.nonlocal_names) {
        def.local_names.erase(name);
    }
}

// ---------------------------------------------------------------------------
// Expressions

ExprPtr Parser::ParseTestListStarExpr() {
    const Token& start = Peek();
    auto first = ParseTestOrStar();
    if (!IsOp(",")) {
        return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, start);
    tuple->children.push_back(std::move(first));
    while (MatchOp(",")) {
        if (!CanStartExpression(Peek())) {
            break;
        }
        tuple->children.push_back(ParseTestOrStar());
    }
    return tuple;
}

ExprPtr Parser::ParseTestOrStar() {
    if (IsOp("*")) {
        const Token& star = Advance();
        auto starred = MakeExpr(ExprKind::kStarred, star);
        starred->children.push_back(ParseBitOr());
        return starred;
    }
    return ParseTest();
}

ExprPtr Parser::ParseTest() {
    if (IsKeyword("lambda")) {
        return ParseLambda();
    }
    NestingGuard guard(*this, Peek());
    auto body = ParseOrTest();
    if (!IsKeyword("if")) {
        return body;
    }
    Advance();
    auto expr = MakeExpr(ExprKind::kIfExp, body->line, body->column);
    auto test = ParseOrTest();
    ExpectKeyword("else");
    auto orelse = ParseTest();
    expr->children.push_back(std::move(test));
    expr->children.push_back(std::move(body));
    expr->children.push_back(std::move(orelse));
    return expr;
}

ExprPtr Parser::ParseLambda() {
    const Token& keyword = Advance();
    auto def = std::make_shared<FunctionDef>();
    def->name = "<lambda>";
    def->line = keyword.line;
    def->is_lambda = true;
    ParseParameters(*def, ":", false);

    functions_.push_back(def.get());
    const int saved_loop_depth = loop_depth_;
    loop_depth_ = 0;
    def->local_names.insert(def->params.begin(), def->params.end());
    if (!def->vararg.empty()) {
        def->local_names.insert(def->vararg);
    }
    auto body = MakeStmt(StmtKind::kReturn, keyword);
    body->value = ParseTest();
    def->body.push_back(std::move(body));
    loop_depth_ = saved_loop_depth;
    functions_.pop_back();

    FinishFunction(*def);
    auto expr = MakeExpr(ExprKind::kLambda, keyword);
    expr->function = std::move(def);
    return expr;
}

ExprPtr Parser::ParseOrTest() {
    auto first = ParseAndTest();
    if (!IsKeyword("or")) {
        return first;
    }
    auto expr = MakeExpr(ExprKind::kBoolOp, first->line, first->column);
    expr->is_and = false;
    expr->children.push_back(std::move(first));
    while (MatchKeyword("or")) {
        expr->children.push_back(ParseAndTest());
    }
    return expr;
}

ExprPtr Parser::ParseAndTest() {
    auto first = ParseNotTest();
    if (!IsKeyword("and")) {
        return first;
    }
    auto expr = MakeExpr(ExprKind::kBoolOp, first->line, first->column);
    expr->is_and = true;
    expr->children.push_back(std::move(first));
    while (MatchKeyword("and")) {
        expr->children.push_back(ParseNotTest());
    }
    return expr;
}

ExprPtr Parser::ParseNotTest() {
    if (!IsKeyword("not")) {
        return ParseComparison();
    }
    const Token& keyword = Advance();
    NestingGuard guard(*this, keyword);
    auto expr = MakeExpr(ExprKind::kUnaryOp, keyword);
    expr->unary_op = UnaryOperator::kNot;
    expr->children.push_back(ParseNotTest());
    return expr;
}

ExprPtr Parser::ParseComparison() {
    auto first = ParseBitOr();
    ExprPtr expr;
    while (true) {
        CompareOperator op;
        if (IsOp("<")) {
            op = CompareOperator::kLt;
        } else if (IsOp(">")) {
            op = CompareOperator::kGt;
        } else if (IsOp("==")) {
            op = CompareOperator::kEq;
        } else if (IsOp(">=")) {
            op = CompareOperator::kGtE;
        } else if (IsOp("<=")) {
            op = CompareOperator::kLtE;
        } else if (IsOp("!=")) {
            op = CompareOperator::kNotEq;
        } else if (IsKeyword("in")) {
            op = CompareOperator::kIn;
        } else if (IsKeyword("not") && IsKeyword("in", 1)) {
            Advance();
            op = CompareOperator::kNotIn;
        } else if (IsKeyword("is")) {
            if (IsKeyword("not", 1)) {
                Advance();
                op = CompareOperator::kIsNot;
            } else {
                op = CompareOperator::kIs;
            }
        } else {
            break;
        }
        Advance();
        if (!expr) {
            expr = MakeExpr(ExprKind::kCompare, first->line, first->column);
            expr->children.push_back(std::move(first));
        }
        expr->compare_ops.push_back(op);
        expr->children.push_back(ParseBitOr());
    }
    return expr ? std::move(expr) : std::move(first);
}

ExprPtr Parser::ParseBitOr() {
    auto expr = ParseBitXor();
    while (MatchOp("|")) {
        expr = MakeBinary(BinaryOperator::kBitOr, std::move(expr), ParseBitXor());
    }
    return expr;
}

ExprPtr Parser::ParseBitXor() {
    auto expr = ParseBitAnd();
    while (MatchOp("^")) {
        expr = MakeBinary(BinaryOperator::kBitXor, std::move(expr), ParseBitAnd());
    }
    return expr;
}

ExprPtr Parser::ParseBitAnd() {
    auto expr = ParseShift();
    while (MatchOp("&")) {
        expr = MakeBinary(BinaryOperator::kBitAnd, std::move(expr), ParseShift());
    }
    return expr;
}

ExprPtr Parser::ParseShift() {
    auto expr = ParseArith();
    while (true) {
        if (MatchOp("<<")) {
            expr = MakeBinary(BinaryOperator::kLShift, std::move(expr), ParseArith());
        } else if (MatchOp(">>")) {
            expr = MakeBinary(BinaryOperator::kRShift, std::move(expr), ParseArith());
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::ParseArith() {
    auto expr = ParseTerm();
    while (true) {
        if (MatchOp("+")) {
            expr = MakeBinary(BinaryOperator::kAdd, std::move(expr), ParseTerm());
        } else if (MatchOp("-")) {
            expr = MakeBinary(BinaryOperator::kSub, std::move(expr), ParseTerm());
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::ParseTerm() {
    auto expr = ParseFactor();
    while (true) {
        if (MatchOp("*")) {
            expr = MakeBinary(BinaryOperator::kMul, std::move(expr), ParseFactor());
        } else if (MatchOp("/")) {
            expr = MakeBinary(BinaryOperator::kDiv, std::move(expr), ParseFactor());
        } else if (MatchOp("//")) {
            expr = MakeBinary(BinaryOperator::kFloorDiv, std::move(expr), ParseFactor());
        } else if (MatchOp("%")) {
            expr = MakeBinary(BinaryOperator::kMod, std::move(expr), ParseFactor());
        } else if (IsOp("@")) {
            Unsupported("matrix multiplication ('@') is not supported", Peek());
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::ParseFactor() {
    if (IsOp("+") || IsOp("-") || IsOp("~")) {
        const Token& token = Advance();
        NestingGuard guard(*this, token);
        auto expr = MakeExpr(ExprKind::kUnaryOp, token);
        expr->unary_op = token.text == "+" ? UnaryOperator::kPos
                                           : (token.text == "-" ? UnaryOperator::kNeg : UnaryOperator::kInvert);
        expr->children.push_back(ParseFactor());
        return expr;
    }
    return ParsePower();
}

ExprPtr Parser::ParsePower() {
    auto base = ParseAtomExpr();
    if (!IsOp("**")) {
        return base;
    }
    const Token& token = Advance();
    NestingGuard guard(*this, token);
    return MakeBinary(BinaryOperator::kPow, std::move(base), ParseFactor());
}

ExprPtr Parser::ParseAtomExpr() {
    auto expr = ParseAtom();
    while (true) {
        if (IsOp("(")) {
            const Token& open = Advance();
            expr = ParseCall(std::move(expr), open);
        } else if (IsOp("[")) {
            const Token& open = Advance();
            expr = ParseSubscript(std::move(expr), open);
        } else if (IsOp(".")) {
            Advance();
            auto attribute = MakeExpr(ExprKind::kAttribute, expr->line, expr->column);
            attribute->name = ExpectName();
            attribute->children.push_back(std::move(expr));
            expr = std::move(attribute);
        } else {
            return expr;
        }
    }
}

ExprPtr Parser::ParseAtom() {
    const Token& token = Peek();
    switch (token.type) {
        case TokenType::kInt: {
            Advance();
            auto expr = MakeExpr(ExprKind::kConstant, token);
            expr->constant = Value::Int(token.int_value);
            return expr;
        }
        case TokenType::kFloat: {
            Advance();
            auto expr = MakeExpr(ExprKind::kConstant, token);
            expr->constant = Value::Float(token.float_value);
            return expr;
        }
        case TokenType::kString:
        case TokenType::kFString:
            return ParseStrings();
        case TokenType::kName: {
            if (IsReserved(token)) {
                if (token.text == "True" || token.text == "False" || token.text == "None") {
                    Advance();
                    auto expr = MakeExpr(ExprKind::kConstant, token);
                    expr->constant = token.text == "None" ? Value::None() : Value::Bool(token.text == "True");
                    return expr;
                }
                if (token.text == "yield") {
                    Unsupported("generators ('yield') are not supported", token);
                }
                if (token.text == "await") {
                    Unsupported("'await' is not supported", token);
                }
                Fail("invalid syntax", token);
            }
            Advance();
            auto expr = MakeExpr(ExprKind::kName, token);
            expr->name = token.text;
            return expr;
        }
        case TokenType::kOp: {
            if (token.text == "(") {
                const Token& open = Advance();
                return ParseParenthesized(open);
            }
            if (token.text == "[") {
                const Token& open = Advance();
                return ParseListDisplay(open);
            }
            if (token.text == "{") {
                const Token& open = Advance();
                return ParseBraceDisplay(open);
            }
            if (token.text == "...") {
                Unsupported("Ellipsis is not supported", token);
            }
            Fail("invalid syntax", token);
        }
        case TokenType::kIndent:
            FailIndent("unexpected indent", token);
        default:
            Fail("invalid syntax", token);
    }
}

ExprPtr Parser::ParseParenthesized(const Token& open) {
    NestingGuard guard(*this, open);
    if (MatchOp(")")) {
        return MakeExpr(ExprKind::kTuple, open);
    }
    if (IsKeyword("yield")) {
        Unsupported("generators ('yield') are not supported", Peek());
    }
    auto first = ParseTestOrStar();
    if (IsKeyword("for")) {
        auto generator = MakeExpr(ExprKind::kGenerator, open);
        generator->children.push_back(std::move(first));
        generator->generators = ParseComprehensionClauses();
        ExpectOp(")");
        return generator;
    }
    if (IsOp(",")) {
        auto tuple = MakeExpr(ExprKind::kTuple, open);
        tuple->children.push_back(std::move(first));
        while (MatchOp(",")) {
            if (IsOp(")")) {
                break;
            }
            tuple->children.push_back(ParseTestOrStar());
        }
        ExpectOp(")");
        return tuple;
    }
    ExpectOp(")");
    if (first->kind == ExprKind::kStarred) {
        Fail("cannot use starred expression here", open);
    }
    return first;
}

ExprPtr Parser::ParseListDisplay(const Token& open) {
    NestingGuard guard(*this, open);
    auto list = MakeExpr(ExprKind::kList, open);
    if (MatchOp("]")) {
        return list;
    }
    auto first = ParseTestOrStar();
    if (IsKeyword("for")) {
        auto comprehension = MakeExpr(ExprKind::kListComp, open);
        comprehension->children.push_back(std::move(first));
        comprehension->generators = ParseComprehensionClauses();
        ExpectOp("]");
        return comprehension;
    }
    list->children.push_back(std::move(first));
    while (MatchOp(",")) {
        if (IsOp("]")) {
            break;
        }
        list->children.push_back(ParseTestOrStar());
    }
    ExpectOp("]");
    return list;
}

ExprPtr Parser::ParseBraceDisplay(const Token& open) {
    NestingGuard guard(*this, open);
    if (MatchOp("}")) {
        return MakeExpr(ExprKind::kDict, open);
    }
    if (IsOp("**")) {
        Unsupported("dictionary unpacking is not supported", Peek());
    }
    auto first = ParseTestOrStar();
    if (MatchOp(":")) {
        if (first->kind == ExprKind::kStarred) {
            Fail("cannot use a starred expression in a dictionary key", open);
        }
        auto value = ParseTest();
        if (IsKeyword("for")) {
            auto comprehension = MakeExpr(ExprKind::kDictComp, open);
            comprehension->children.push_back(std::move(first));
            comprehension->children.push_back(std::move(value));
            comprehension->generators = ParseComprehensionClauses();
            ExpectOp("}");
            return comprehension;
        }
        auto dict = MakeExpr(ExprKind::kDict, open);
        dict->children.push_back(std::move(first));
        dict->children.push_back(std::move(value));
        while (MatchOp(",")) {
            if (IsOp("}")) {
                break;
            }
            if (IsOp("**")) {
                Unsupported("dictionary unpacking is not supported", Peek());
            }
            dict->children.push_back(ParseTest());
            ExpectOp(":", "':' expected after dictionary key");
            dict->children.push_back(ParseTest());
        }
        ExpectOp("}");
        return dict;
    }
    if (IsKeyword("for")) {
        auto comprehension = MakeExpr(ExprKind::kSetComp, open);
        comprehension->children.push_back(std::move(first));
        comprehension->generators = ParseComprehensionClauses();
        ExpectOp("}");
        return comprehension;
    }
    auto set = MakeExpr(ExprKind::kSet, open);
    set->children.push_back(std::move(first));
    while (MatchOp(",")) {
        if (IsOp("}")) {
            break;
        }
        set->children.push_back(ParseTestOrStar());
    }
    ExpectOp("}");
    return set;
}

std::vector<Comprehension> Parser::ParseComprehensionClauses() {
    std::vector<Comprehension> clauses;
    while (IsKeyword("for")) {
        Advance();
        Comprehension clause;
        clause.target = ParseExprList();
        ValidateTarget(*clause.target, false, false);
        ExpectKeyword("in");
        clause.iter = ParseOrTest();
        while (MatchKeyword("if")) {
            clause.conditions.push_back(ParseOrTest());
        }
        clauses.push_back(std::move(clause));
    }
    return clauses;
}

ExprPtr Parser::ParseExprList() {
    const Token& start = Peek();
    auto item = [this]() -> ExprPtr {
        if (IsOp("*")) {
            const Token& star = Advance();
            auto starred = MakeExpr(ExprKind::kStarred, star);
            starred->children.push_back(ParseBitOr());
            return starred;
        }
        return ParseBitOr();
    };
    auto first = item();
    if (!IsOp(",")) {
        return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, start);
    tuple->children.push_back(std::move(first));
    while (MatchOp(",")) {
        if (!CanStartExpression(Peek())) {
            break;
        }
        tuple->children.push_back(item());
    }
    return tuple;
}

ExprPtr Parser::ParseCall(ExprPtr callee, const Token& open) {
    NestingGuard guard(*this, open);
    auto call = MakeExpr(ExprKind::kCall, callee->line, callee->column);
    call->children.push_back(std::move(callee));
    bool seen_keyword = false;
    std::unordered_set<std::string> keyword_names;
    while (!IsOp(")")) {
        const Token& token = Peek();
        if (IsOp("**")) {
            Unsupported("keyword argument unpacking ('**') is not supported", token);
        }
        if (token.type == TokenType::kName && !IsReserved(token) && IsOp("=", 1)) {
            Advance();
            Advance();
            if (!keyword_names.insert(token.text).second) {
                Fail("keyword argument repeated: " + token.text, token);
            }
            KeywordArg keyword;
            keyword.name = token.text;
            keyword.value = ParseTest();
            call->keywords.push_back(std::move(keyword));
            seen_keyword = true;
        } else if (IsOp("*")) {
            const Token& star = Advance();
            auto starred = MakeExpr(ExprKind::kStarred, star);
            starred->children.push_back(ParseTest());
            call->children.push_back(std::move(starred));
        } else {
            if (seen_keyword) {
                Fail("positional argument follows keyword argument", token);
            }
            auto argument = ParseTest();
            if (IsKeyword("for")) {
                auto generator = MakeExpr(ExprKind::kGenerator, token);
                generator->children.push_back(std::move(argument));
                generator->generators = ParseComprehensionClauses();
                if (call->children.size() != 1 || !IsOp(")")) {
                    Fail("Generator expression must be parenthesized", token);
                }
                argument = std::move(generator);
            }
            call->children.push_back(std::move(argument));
        }
        if (!MatchOp(",")) {
            break;
        }
    }
    ExpectOp(")");
    return call;
}

ExprPtr Parser::ParseSubscript(ExprPtr object, const Token& open) {
    NestingGuard guard(*this, open);
    auto subscript = MakeExpr(ExprKind::kSubscript, object->line, object->column);
    subscript->children.push_back(std::move(object));
    auto index = ParseSliceItem();
    if (IsOp(",")) {
        auto tuple = MakeExpr(ExprKind::kTuple, open);
        tuple->children.push_back(std::move(index));
        while (MatchOp(",")) {
            if (IsOp("]")) {
                break;
            }
            tuple->children.push_back(ParseSliceItem());
        }
        index = std::move(tuple);
    }
    ExpectOp("]");
    subscript->children.push_back(std::move(index));
    return subscript;
}

ExprPtr Parser::ParseSliceItem() {
    const Token& start = Peek();
    ExprPtr lower;
    if (!IsOp(":")) {
        lower = ParseTest();
        if (!IsOp(":")) {
            return lower;
        }
    }
    Advance();
    auto slice = MakeExpr(ExprKind::kSlice, start);
    ExprPtr upper;
    ExprPtr step;
    if (!IsOp(":") && !IsOp("]") && !IsOp(",")) {
        upper = ParseTest();
    }
    if (MatchOp(":") && !IsOp("]") && !IsOp(",")) {
        step = ParseTest();
    }
    slice->children.push_back(std::move(lower));
    slice->children.push_back(std::move(upper));
    slice->children.push_back(std::move(step));
    return slice;
}

ExprPtr Parser::ParseStrings() {
    const Token& first = Peek();
    bool formatted = false;
    std::vector<FStringPart> parts;
    while (Peek().type == TokenType::kString || Peek().type == TokenType::kFString) {
        const Token& token = Advance();
        if (token.type == TokenType::kString) {
            AppendLiteral(parts, token.text);
        } else {
            formatted = true;
            ParseFStringBody(token, parts);
        }
    }
    if (!formatted) {
        auto expr = MakeExpr(ExprKind::kConstant, first);
        expr->constant = Value::Str(parts.empty() ? std::string() : parts.front().literal);
        return expr;
    }
    auto expr = MakeExpr(ExprKind::kFString, first);
    expr->fstring_parts = std::move(parts);
    return expr;
}

void Parser::ParseFStringBody(const Token& token, std::vector<FStringPart>& parts) {
    const std::string& body = token.text;
    std::string literal;
    auto flush = [&]() {
        AppendLiteral(parts, token.raw ? literal : DecodeEscapes(literal));
        literal.clear();
    };

    std::size_t i = 0;
    while (i < body.size()) {
        const char ch = body[i];
        if (ch == '}') {
            if (i + 1 < body.size() && body[i + 1] == '}') {
                literal.push_back('}');
                i += 2;
                continue;
            }
            Fail("f-string: single '}' is not allowed", token);
        }
        if (ch != '{') {
            literal.push_back(ch);
            ++i;
            continue;
        }
        if (i + 1 < body.size() && body[i + 1] == '{') {
            literal.push_back('{');
            i += 2;
            continue;
        }
        flush();

        std::size_t j = i + 1;
        int depth = 0;
        char quote = 0;
        for (; j < body.size(); ++j) {
            const char c = body[j];
            if (quote != 0) {
                if (c == quote) {
                    quote = 0;
                }
                continue;
            }
            if (c == '\'' || c == '"') {
                quote = c;
            } else if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if (c == ')' || c == ']' || c == '}') {
                if (depth == 0) {
                    break;
                }
                --depth;
            } else if (depth == 0 && c == '!' && j + 1 < body.size() && body[j + 1] != '=') {
                break;
            } else if (depth == 0 && c == ':') {
                break;
            }
        }
        if (j >= body.size() || body[j] == ')' || body[j] == ']') {
            Fail("f-string: expecting '}'", token);
        }

        std::string expression = body.substr(i + 1, j - i - 1);
        FStringPart part;
        const std::string trimmed = TrimRight(expression);
        bool debug = false;
        if (trimmed.size() > 1 && trimmed.back() == '=') {
            const char before = trimmed[trimmed.size() - 2];
            if (before != '=' && before != '!' && before != '<' && before != '>') {
                debug = true;
                AppendLiteral(parts, expression);
                expression = trimmed.substr(0, trimmed.size() - 1);
            }
        }
        if (expression.find_first_not_of(" \t\n") == std::string::npos) {
            Fail("f-string: empty expression not allowed", token);
        }
        Lexer lexer(expression, token.line, true);
        Parser sub_parser(lexer.Tokenize());
        part.expr = sub_parser.ParseStandaloneExpression();

        if (body[j] == '!') {
            if (j + 1 >= body.size() || (body[j + 1] != 'r' && body[j + 1] != 's' && body[j + 1] != 'a')) {
                Fail("f-string: invalid conversion character: expected 's', 'r', or 'a'", token);
            }
            part.conversion = body[j + 1] == 's' ? 's' : 'r';
            j += 2;
            if (j >= body.size() || (body[j] != ':' && body[j] != '}')) {
                Fail("f-string: expecting '}'", token);
            }
        }
        if (body[j] == ':') {
            std::size_t k = j + 1;
            while (k < body.size() && body[k] != '}') {
                if (body[k] == '{') {
                    Unsupported("f-string: nested replacement fields are not supported", token);
                }
                ++k;
            }
            if (k >= body.size()) {
                Fail("f-string: expecting '}'", token);
            }
            part.format_spec = body.substr(j + 1, k - j - 1);
            j = k;
        }
        if (debug && part.conversion == 0 && part.format_spec.empty()) {
            part.conversion = 'r';
        }
        parts.push_back(std::move(part));
        i = j + 1;
    }
    flush();
}

std::unique_ptr<Program> ParseSource(const std::string& source) {
    Lexer lexer(source);
    Parser parser(lexer.Tokenize());
    return parser.ParseProgram();
}

}  // namespace evalbox::lang
