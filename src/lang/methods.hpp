#pragma once

#include <string>
#include <vector>

#include "lang/value.hpp"

namespace evalbox::lang {

class Interpreter;

// Built-in methods of str, list, tuple, dict, set, int and float.
bool HasMethod(const Value& self, const std::string& name);
Value CallMethod(Interpreter& interpreter, const Value& self, const std::string& name, CallArguments& args);

// Python's format-spec mini language, shared by format(), str.format() and
// f-strings.
std::string FormatValue(const Value& value, const std::string& spec);
// printf-style formatting behind `str % args`.
std::string PercentFormat(const std::string& format, const Value& args);
std::string StrFormat(const std::string& format, const CallArguments& args);

// Stable sort with Python's key/reverse semantics.
void SortValues(Interpreter& interpreter, std::vector<Value>& items, const Value* key, bool reverse);

// Argument helpers shared with the builtins.
void CheckArity(const std::string& name, const CallArguments& args, std::size_t min, std::size_t max);
void CheckKeywords(const std::string& name, const CallArguments& args, const std::vector<std::string>& allowed);
const Value* Argument(const CallArguments& args, std::size_t position, const std::string& keyword);
std::int64_t RequireInt(const Value& value);
const std::string& RequireStr(const Value& value, const std::string& context);

}  // namespace evalbox::lang
