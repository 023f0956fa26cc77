#include "lang/lexer.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>

#include "lang/script_error.hpp"
#include "lang/value.hpp"

namespace evalbox::lang {
namespace {

bool IsIdentifierStart(char ch) {
    const auto byte = static_cast<unsigned char>(ch);
    return std::isalpha(byte) || ch == '_' || byte >= 0x80;
}

bool IsIdentifierChar(char ch) {
    return IsIdentifierStart(ch) || std::isdigit(static_cast<unsigned char>(ch));
}

bool IsStringPrefix(const std::string& word) {
    if (word.empty() || word.size() > 2) {
        return false;
    }
    std::string lowered = word;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    static const char* kPrefixes[] = {"r", "u", "f", "b", "rf", "fr", "br", "rb"};
    for (const auto* prefix : kPrefixes) {
        if (lowered == prefix) {
            return true;
        }
    }
    return false;
}

int HexValue(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

const char* kThreeCharOps[] = {"**=", "//=", ">>=", "<<=", "..."};
const char* kTwoCharOps[] = {"**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", "+=", "-=",
                             "*=", "/=", "%=", "&=", "|=", "^=", ":=", "@="};
const char kSingleCharOps[] = "+-*/%@&|^~<>()[]{},:.;=";

char ClosingFor(char open) {
    switch (open) {
        case '(': return ')';
        case '[': return ']';
        default: return '}';
    }
}

}  // namespace

std::string DecodeEscapes(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        const char ch = raw[i];
        if (ch != '\\' || i + 1 >= raw.size()) {
            out.push_back(ch);
            continue;
        }
        const char next = raw[++i];
        switch (next) {
            case '\n': break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"': out.push_back('"'); break;
            case 'a': out.push_back('\a'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'v': out.push_back('\v'); break;
            case 'x':
            case 'u':
            case 'U': {
                const std::size_t digits = next == 'x' ? 2 : (next == 'u' ? 4 : 8);
                char32_t code_point = 0;
                std::size_t consumed = 0;
                while (consumed < digits && i + 1 + consumed < raw.size()) {
                    const int value = HexValue(raw[i + 1 + consumed]);
                    if (value < 0) {
                        break;
                    }
                    code_point = (code_point << 4) | static_cast<char32_t>(value);
                    ++consumed;
                }
                if (consumed != digits) {
                    out.push_back('\\');
                    out.push_back(next);
                    break;
                }
                i += consumed;
                out += EncodeUtf8(code_point);
                break;
            }
            default:
                if (next >= '0' && next <= '7') {
                    int value = next - '0';
                    std::size_t consumed = 0;
                    while (consumed < 2 && i + 1 + consumed < raw.size() && raw[i + 1 + consumed] >= '0' &&
                           raw[i + 1 + consumed] <= '7') {
                        value = value * 8 + (raw[i + 1 + consumed] - '0');
                        ++consumed;
                    }
                    i += consumed;
                    out += EncodeUtf8(static_cast<char32_t>(value));
                } else {
                    out.push_back('\\');
                    out.push_back(next);
                }
        }
    }
    return out;
}

Lexer::Lexer(std::string source, int first_line, bool expression_mode)
    : source_(std::move(source))
    , line_(first_line)
    , expression_mode_(expression_mode)
    , at_line_start_(!expression_mode) {}

char Lexer::Peek(std::size_t offset) const {
    const std::size_t index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
}

void Lexer::Advance(std::size_t count) {
    for (std::size_t i = 0; i < count && pos_ < source_.size(); ++i) {
        if (source_[pos_] == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

void Lexer::Fail(const std::string& message, int line, int column) const {
    throw SyntaxError("SyntaxError", message, line, column);
}

void Lexer::FailIndent(const std::string& message, int line, int column) const {
    throw SyntaxError("IndentationError", message, line, column);
}

void Lexer::Emit(TokenType type, std::string text, int line, int column) {
    Token token;
    token.type = type;
    token.text = std::move(text);
    token.line = line;
    token.column = column;
    tokens_.push_back(std::move(token));
}

// Measures indentation of a new logical line. Returns false for blank and
// comment-only lines, which are consumed entirely.
bool Lexer::HandleLineStart() {
    int width = 0;
    while (pos_ < source_.size()) {
        const char ch = Peek();
        if (ch == ' ') {
            ++width;
        } else if (ch == '\t') {
            width = (width / 8 + 1) * 8;
        } else if (ch == '\f') {
            width = 0;
        } else {
            break;
        }
        Advance();
    }
    const char ch = Peek();
    if (ch == '#' || ch == '\n' || ch == '\r' || ch == '\0') {
        while (pos_ < source_.size() && Peek() != '\n') {
            Advance();
        }
        Advance();
        return false;
    }
    if (width > indents_.back()) {
        indents_.push_back(width);
        Emit(TokenType::kIndent, "", line_, column_);
    } else {
        while (width < indents_.back()) {
            indents_.pop_back();
            Emit(TokenType::kDedent, "", line_, column_);
        }
        if (width != indents_.back()) {
            FailIndent("unindent does not match any outer indentation level", line_, column_);
        }
    }
    return true;
}

std::vector<Token> Lexer::Tokenize() {
    while (pos_ < source_.size()) {
        if (at_line_start_ && brackets_.empty()) {
            if (!HandleLineStart()) {
                continue;
            }
            at_line_start_ = false;
        }
        const char ch = Peek();
        if (ch == ' ' || ch == '\t' || ch == '\f' || ch == '\r') {
            Advance();
        } else if (ch == '#') {
            while (pos_ < source_.size() && Peek() != '\n') {
                Advance();
            }
        } else if (ch == '\\') {
            if (Peek(1) == '\n') {
                Advance(2);
            } else if (Peek(1) == '\r' && Peek(2) == '\n') {
                Advance(3);
            } else {
                Fail("unexpected character after line continuation character", line_, column_);
            }
        } else if (ch == '\n') {
            if (!expression_mode_ && brackets_.empty()) {
                if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline) {
                    Emit(TokenType::kNewline, "", line_, column_);
                }
                at_line_start_ = true;
            }
            Advance();
        } else if (std::isdigit(static_cast<unsigned char>(ch)) ||
                   (ch == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            ReadNumber();
        } else if (IsIdentifierStart(ch)) {
            ReadNameOrString();
        } else if (ch == '"' || ch == '\'') {
            ReadString("", line_, column_);
        } else {
            ReadOperator();
        }
    }
    if (!brackets_.empty()) {
        const auto& open = brackets_.back();
        Fail(std::string("'") + open.symbol + "' was never closed", open.line, open.column);
    }
    if (!expression_mode_) {
        if (!tokens_.empty() && tokens_.back().type != TokenType::kNewline) {
            Emit(TokenType::kNewline, "", line_, column_);
        }
        while (indents_.size() > 1) {
            indents_.pop_back();
            Emit(TokenType::kDedent, "", line_, column_);
        }
    }
    Emit(TokenType::kEnd, "", line_, column_);
    return std::move(tokens_);
}

void Lexer::ReadNumber() {
    const int line = line_;
    const int column = column_;
    const std::size_t start = pos_;
    const char first = Peek();
    const char second = static_cast<char>(std::tolower(static_cast<unsigned char>(Peek(1))));

    if (first == '0' && (second == 'x' || second == 'o' || second == 'b')) {
        const int base = second == 'x' ? 16 : (second == 'o' ? 8 : 2);
        Advance(2);
        std::string digits;
        while (pos_ < source_.size() && (std::isalnum(static_cast<unsigned char>(Peek())) || Peek() == '_')) {
            if (Peek() != '_') {
                digits.push_back(Peek());
            }
            Advance();
        }
        std::int64_t value = 0;
        const auto result = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
        if (digits.empty() || result.ec == std::errc::invalid_argument ||
            result.ptr != digits.data() + digits.size()) {
            Fail("invalid " + std::string(base == 16 ? "hexadecimal" : (base == 8 ? "octal" : "binary")) +
                     " literal",
                 line, column);
        }
        if (result.ec == std::errc::result_out_of_range) {
            Fail("integer literal is too large", line, column);
        }
        Emit(TokenType::kInt, source_.substr(start, pos_ - start), line, column);
        tokens_.back().int_value = value;
        return;
    }

    std::string cleaned;
    bool is_float = false;
    auto read_digits = [&]() {
        while (pos_ < source_.size() && (std::isdigit(static_cast<unsigned char>(Peek())) || Peek() == '_')) {
            if (Peek() != '_') {
                cleaned.push_back(Peek());
            }
            Advance();
        }
    };
    read_digits();
    if (Peek() == '.' && !(Peek(1) == '.' && Peek(2) == '.')) {
        is_float = true;
        cleaned.push_back('.');
        Advance();
        read_digits();
    }
    if (Peek() == 'e' || Peek() == 'E') {
        const char after = Peek(1);
        const bool signed_exp = (after == '+' || after == '-') && std::isdigit(static_cast<unsigned char>(Peek(2)));
        if (std::isdigit(static_cast<unsigned char>(after)) || signed_exp) {
            is_float = true;
            cleaned.push_back('e');
            Advance();
            if (signed_exp) {
                cleaned.push_back(Peek());
                Advance();
            }
            read_digits();
        }
    }
    if (Peek() == 'j' || Peek() == 'J') {
        Fail("complex literals are not supported", line, column);
    }
    if (IsIdentifierStart(Peek())) {
        Fail("invalid decimal literal", line, column);
    }

    if (is_float) {
        double value = 0.0;
        const auto result = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
        if (result.ec == std::errc::invalid_argument) {
            Fail("invalid decimal literal", line, column);
        }
        Emit(TokenType::kFloat, source_.substr(start, pos_ - start), line, column);
        tokens_.back().float_value = value;
        return;
    }
    if (cleaned.size() > 1 && cleaned[0] == '0' &&
        cleaned.find_first_not_of('0') != std::string::npos) {
        Fail("leading zeros in decimal integer literals are not permitted", line, column);
    }
    std::int64_t value = 0;
    const auto result = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
    if (result.ec == std::errc::result_out_of_range) {
        Fail("integer literal is too large", line, column);
    }
    Emit(TokenType::kInt, source_.substr(start, pos_ - start), line, column);
    tokens_.back().int_value = value;
}

void Lexer::ReadNameOrString() {
    const int line = line_;
    const int column = column_;
    const std::size_t start = pos_;
    while (pos_ < source_.size() && IsIdentifierChar(Peek())) {
        Advance();
    }
    std::string word = source_.substr(start, pos_ - start);
    if ((Peek() == '"' || Peek() == '\'') && IsStringPrefix(word)) {
        ReadString(word, line, column);
        return;
    }
    Emit(TokenType::kName, std::move(word), line, column);
}

void Lexer::ReadString(const std::string& prefix, int line, int column) {
    std::string lowered = prefix;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered.find('b') != std::string::npos) {
        Fail("bytes literals are not supported", line, column);
    }
    const bool raw = lowered.find('r') != std::string::npos;
    const bool formatted = lowered.find('f') != std::string::npos;

    const char quote = Peek();
    const bool triple = Peek(1) == quote && Peek(2) == quote;
    Advance(triple ? 3 : 1);

    std::string body;
    while (true) {
        if (pos_ >= source_.size()) {
            if (triple) {
                Fail("unterminated triple-quoted string literal (detected at line " + std::to_string(line_) + ")",
                     line, column);
            }
            Fail("unterminated string literal (detected at line " + std::to_string(line) + ")", line, column);
        }
        const char ch = Peek();
        if (ch == '\\') {
            body.push_back(ch);
            Advance();
            if (pos_ < source_.size()) {
                body.push_back(Peek());
                Advance();
            }
            continue;
        }
        if (ch == quote) {
            if (!triple) {
                Advance();
                break;
            }
            if (Peek(1) == quote && Peek(2) == quote) {
                Advance(3);
                break;
            }
        }
        if (ch == '\n' && !triple) {
            Fail("unterminated string literal (detected at line " + std::to_string(line) + ")", line, column);
        }
        body.push_back(ch);
        Advance();
    }

    if (formatted) {
        Emit(TokenType::kFString, std::move(body), line, column);
        tokens_.back().raw = raw;
        return;
    }
    Emit(TokenType::kString, raw ? std::move(body) : DecodeEscapes(body), line, column);
}

void Lexer::ReadOperator() {
    const int line = line_;
    const int column = column_;
    for (const auto* op : kThreeCharOps) {
        if (source_.compare(pos_, 3, op) == 0) {
            Advance(3);
            Emit(TokenType::kOp, op, line, column);
            return;
        }
    }
    for (const auto* op : kTwoCharOps) {
        if (source_.compare(pos_, 2, op) == 0) {
            Advance(2);
            Emit(TokenType::kOp, op, line, column);
            return;
        }
    }
    const char ch = Peek();
    if (std::string(kSingleCharOps).find(ch) == std::string::npos) {
        char code[16];
        std::snprintf(code, sizeof(code), "U+%04X", static_cast<unsigned>(static_cast<unsigned char>(ch)));
        Fail(std::string("invalid character '") + ch + "' (" + code + ")", line, column);
    }
    if (ch == '(' || ch == '[' || ch == '{') {
        brackets_.push_back(OpenBracket{ch, line, column});
    } else if (ch == ')' || ch == ']' || ch == '}') {
        if (brackets_.empty()) {
            Fail(std::string("unmatched '") + ch + "'", line, column);
        }
        const auto open = brackets_.back();
        if (ClosingFor(open.symbol) != ch) {
            Fail(std::string("closing parenthesis '") + ch + "' does not match opening parenthesis '" +
                     open.symbol + "'",
                 line, column);
        }
        brackets_.pop_back();
    }
    Advance();
    Emit(TokenType::kOp, std::string(1, ch), line, column);
}

}  // namespace evalbox::lang
