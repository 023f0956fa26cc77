#include "security/structural_check.hpp"

#include <algorithm>

namespace evalbox::security {
namespace {

bool IsDunder(const std::string& name) {
    return name.size() > 4 && name.compare(0, 2, "__") == 0 && name.compare(name.size() - 2, 2, "__") == 0;
}

bool IsForbidden(const std::string& name) {
    const auto& names = StructuralChecker::ForbiddenNames();
    return IsDunder(name) || std::find(names.begin(), names.end(), name) != names.end();
}

bool IsSpecialMethod(const std::string& name) {
    const auto& names = StructuralChecker::SpecialMethodNames();
    return std::find(names.begin(), names.end(), name) != names.end();
}

SecurityViolation Violation(std::string reason, std::string construct, int line) {
    return SecurityViolation{std::move(reason), std::move(construct), line};
}

}  // namespace

const std::vector<std::string>& StructuralChecker::ForbiddenNames() {
    static const std::vector<std::string> kNames = {
        "eval",    "exec",    "compile", "open",    "input",   "__import__", "globals",   "locals",
        "vars",    "dir",     "getattr", "setattr", "delattr", "breakpoint", "memoryview"};
    return kNames;
}

const std::vector<std::string>& StructuralChecker::SpecialMethodNames() {
    static const std::vector<std::string> kNames = {
        "__init__", "__repr__", "__str__", "__eq__", "__lt__", "__le__", "__gt__", "__ge__",
        "__hash__", "__bool__", "__len__", "__contains__", "__getitem__", "__setitem__", "__delitem__",
        "__iter__", "__next__", "__call__", "__neg__", "__pos__", "__invert__",
        "__add__", "__sub__", "__mul__", "__truediv__", "__floordiv__", "__mod__", "__pow__",
        "__lshift__", "__rshift__", "__and__", "__or__", "__xor__",
        "__radd__", "__rsub__", "__rmul__", "__rtruediv__", "__rfloordiv__", "__rmod__", "__rpow__",
        "__rlshift__", "__rrshift__", "__rand__", "__ror__", "__rxor__",
        "__iadd__", "__isub__", "__imul__", "__itruediv__", "__ifloordiv__", "__imod__", "__ipow__",
        "__ilshift__", "__irshift__", "__iand__", "__ior__", "__ixor__"};
    return kNames;
}

std::optional<SecurityViolation> StructuralChecker::Check(const lang::Program& program) const {
    return CheckBlock(program.body);
}

std::optional<SecurityViolation> StructuralChecker::CheckBlock(const std::vector<lang::StmtPtr>& body) const {
    for (const auto& stmt : body) {
        if (auto violation = CheckStatement(*stmt)) {
            return violation;
        }
    }
    return std::nullopt;
}

std::optional<SecurityViolation> StructuralChecker::CheckBinding(const std::string& name, int line) const {
    if (IsForbidden(name)) {
        return Violation("Using '" + name + "' is not allowed", name, line);
    }
    return std::nullopt;
}

std::optional<SecurityViolation> StructuralChecker::CheckFunction(const lang::FunctionDef& def, bool in_class) const {
    if (!def.is_lambda && !(in_class && IsSpecialMethod(def.name))) {
        if (auto violation = CheckBinding(def.name, def.line)) {
            return violation;
        }
    }
    for (const auto& param : def.params) {
        if (auto violation = CheckBinding(param, def.line)) {
            return violation;
        }
    }
    if (!def.vararg.empty()) {
        if (auto violation = CheckBinding(def.vararg, def.line)) {
            return violation;
        }
    }
    for (const auto& value : def.defaults) {
        if (auto violation = CheckExpression(value.get())) {
            return violation;
        }
    }
    return CheckBlock(def.body);
}

std::optional<SecurityViolation> StructuralChecker::CheckClass(const lang::ClassDef& def, int line) const {
    if (auto violation = CheckBinding(def.name, line)) {
        return violation;
    }
    for (const auto& base : def.bases) {
        if (auto violation = CheckExpression(base.get())) {
            return violation;
        }
    }
    for (const auto& stmt : def.body) {
        auto violation = stmt->kind == lang::StmtKind::kFunctionDef ? CheckFunction(*stmt->function, true)
                                                                    : CheckStatement(*stmt);
        if (violation) {
            return violation;
        }
    }
    return std::nullopt;
}

std::optional<SecurityViolation> StructuralChecker::CheckStatement(const lang::Stmt& stmt) const {
    using lang::StmtKind;
    if (stmt.kind == StmtKind::kImport) {
        const std::string module = stmt.names.empty() ? std::string() : stmt.names.front();
        return Violation("Importing '" + module + "' module is not allowed", module, stmt.line);
    }
    if (stmt.kind == StmtKind::kFunctionDef) {
        return CheckFunction(*stmt.function);
    }
    if (stmt.kind == StmtKind::kClassDef) {
        return CheckClass(*stmt.class_def, stmt.line);
    }
    if (stmt.kind == StmtKind::kGlobal || stmt.kind == StmtKind::kNonlocal) {
        for (const auto& name : stmt.names) {
            if (auto violation = CheckBinding(name, stmt.line)) {
                return violation;
            }
        }
        return std::nullopt;
    }

    for (const auto* expr : {stmt.target.get(), stmt.value.get(), stmt.test.get(), stmt.cause.get()}) {
        if (auto violation = CheckExpression(expr)) {
            return violation;
        }
    }
    for (const auto& target : stmt.targets) {
        if (auto violation = CheckExpression(target.get())) {
            return violation;
        }
    }
    for (const auto* block : {&stmt.body, &stmt.orelse, &stmt.finalbody}) {
        if (auto violation = CheckBlock(*block)) {
            return violation;
        }
    }
    for (const auto& handler : stmt.handlers) {
        if (auto violation = CheckExpression(handler.type.get())) {
            return violation;
        }
        if (!handler.name.empty()) {
            if (auto violation = CheckBinding(handler.name, handler.line)) {
                return violation;
            }
        }
        if (auto violation = CheckBlock(handler.body)) {
            return violation;
        }
    }
    return std::nullopt;
}

std::optional<SecurityViolation> StructuralChecker::CheckExpression(const lang::Expr* expr) const {
    if (expr == nullptr) {
        return std::nullopt;
    }
    using lang::ExprKind;
    if (expr->kind == ExprKind::kName) {
        return CheckBinding(expr->name, expr->line);
    }
    if (expr->kind == ExprKind::kAttribute && IsDunder(expr->name) && !IsSpecialMethod(expr->name)) {
        return Violation("Accessing '" + expr->name + "' is not allowed", expr->name, expr->line);
    }
    if (expr->kind == ExprKind::kLambda && expr->function) {
        if (auto violation = CheckFunction(*expr->function)) {
            return violation;
        }
    }
    for (const auto& child : expr->children) {
        if (auto violation = CheckExpression(child.get())) {
            return violation;
        }
    }
    for (const auto& keyword : expr->keywords) {
        if (auto violation = CheckExpression(keyword.value.get())) {
            return violation;
        }
    }
    for (const auto& generator : expr->generators) {
        for (const auto* part : {generator.target.get(), generator.iter.get()}) {
            if (auto violation = CheckExpression(part)) {
                return violation;
            }
        }
        for (const auto& condition : generator.conditions) {
            if (auto violation = CheckExpression(condition.get())) {
                return violation;
            }
        }
    }
    for (const auto& part : expr->fstring_parts) {
        if (auto violation = CheckExpression(part.expr.get())) {
            return violation;
        }
    }
    return std::nullopt;
}

}  // namespace evalbox::security
