#pragma once

#include <exception>
#include <stdexcept>
#include <string>

#include "lang/value.hpp"

namespace evalbox::lang {

// Source that could not be tokenized or parsed. kind is "SyntaxError",
// "IndentationError" or "UnsupportedFeature" (valid Python outside the
// subset); line and column are 1-based.
class SyntaxError : public std::runtime_error {
public:
    SyntaxError(std::string kind, const std::string& message, int line, int column);

    const std::string& kind() const { return kind_; }
    const std::string& message() const { return message_; }
    int line() const { return line_; }
    int column() const { return column_; }

private:
    std::string kind_;
    std::string message_;
    int line_;
    int column_;
};

// An exception raised by (or on behalf of) submitted code. It can be caught by
// try/except inside the submission.
class ScriptException : public std::exception {
public:
    ScriptException(Value exception, int line = 0);

    const char* what() const noexcept override { return what_.c_str(); }
    const Value& exception() const { return exception_; }
    std::string TypeName() const;
    std::string Message() const;
    int line() const { return line_; }
    void set_line(int line) { line_ = line; }

private:
    Value exception_;
    int line_;
    std::string what_;
};

// Unwinds an interpreter whose cancellation token fired. Not catchable by
// submitted code.
class ExecutionCancelled : public std::exception {
public:
    const char* what() const noexcept override { return "execution cancelled"; }
};

[[noreturn]] void ThrowError(const std::string& type_name, const std::string& message);
// KeyError keeps the key itself as its argument so str(e) shows its repr.
[[noreturn]] void ThrowKeyError(const Value& key);

}  // namespace evalbox::lang
