#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace evalbox::lang {

enum class TokenType {
    kName,
    kInt,
    kFloat,
    kString,
    kFString,
    kOp,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

struct Token {
    TokenType type = TokenType::kEnd;
    // Names and operators: the spelling. Strings: the decoded value.
    // f-strings: the raw body between the quotes.
    std::string text;
    std::int64_t int_value = 0;
    double float_value = 0.0;
    bool raw = false;  // r-prefixed f-string
    int line = 0;
    int column = 0;
};

class Lexer {
public:
    // expression_mode tokenizes a lone expression (f-string fields): no
    // indentation tracking and newlines are insignificant.
    explicit Lexer(std::string source, int first_line = 1, bool expression_mode = false);

    // Throws SyntaxError.
    std::vector<Token> Tokenize();

private:
    struct OpenBracket {
        char symbol;
        int line;
        int column;
    };

    char Peek(std::size_t offset = 0) const;
    void Advance(std::size_t count = 1);
    [[noreturn]] void Fail(const std::string& message, int line, int column) const;
    [[noreturn]] void FailIndent(const std::string& message, int line, int column) const;

    bool HandleLineStart();
    void ReadNumber();
    void ReadNameOrString();
    void ReadString(const std::string& prefix, int line, int column);
    void ReadOperator();
    void Emit(TokenType type, std::string text, int line, int column);

    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int column_ = 1;
    bool expression_mode_ = false;
    bool at_line_start_ = true;
    std::vector<int> indents_{0};
    std::vector<OpenBracket> brackets_;
    std::vector<Token> tokens_;
};

// Processes backslash escapes of a non-raw string body.
std::string DecodeEscapes(const std::string& raw);

}  // namespace evalbox::lang
