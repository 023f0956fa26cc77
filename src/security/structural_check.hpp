#pragma once

#include <optional>
#include <string>
#include <vector>

#include "lang/ast.hpp"
#include "security/security_filter.hpp"

namespace evalbox::security {

// Walks the parsed program before anything runs and rejects imports, dunder
// attribute access and any reference to or rebinding of a forbidden name.
// Unlike the lexical filter it sees through aliasing such as `f = eval`.
// Special methods the interpreter dispatches (__init__, __eq__, ...) may be
// defined in a class body and reached as attributes; no other dunder may.
class StructuralChecker {
public:
    std::optional<SecurityViolation> Check(const lang::Program& program) const;

    static const std::vector<std::string>& ForbiddenNames();
    static const std::vector<std::string>& SpecialMethodNames();

private:
    std::optional<SecurityViolation> CheckBlock(const std::vector<lang::StmtPtr>& body) const;
    std::optional<SecurityViolation> CheckStatement(const lang::Stmt& stmt) const;
    std::optional<SecurityViolation> CheckExpression(const lang::Expr* expr) const;
    std::optional<SecurityViolation> CheckFunction(const lang::FunctionDef& def, bool in_class = false) const;
    std::optional<SecurityViolation> CheckClass(const lang::ClassDef& def, int line) const;
    std::optional<SecurityViolation> CheckBinding(const std::string& name, int line) const;
};

}  // namespace evalbox::security
