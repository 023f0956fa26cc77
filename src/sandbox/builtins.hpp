#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "lang/value.hpp"

namespace evalbox::sandbox {

class OutputSink;

using BuiltinTable = std::unordered_map<std::string, lang::Value>;

lang::Value MakeBuiltin(const std::string& name, lang::BuiltinCallable fn, const std::string& constructs = "");

void RegisterConstructors(BuiltinTable& table);
void RegisterFunctions(BuiltinTable& table);
void RegisterExceptionTypes(BuiltinTable& table);
void RegisterPrint(BuiltinTable& table, std::shared_ptr<OutputSink> sink);

const std::vector<std::string>& ConstructorNames();
const std::vector<std::string>& FunctionNames();
const std::vector<std::string>& ExceptionTypeNames();

}  // namespace evalbox::sandbox
