#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "lang/value.hpp"

namespace evalbox::lang {

enum class ExprKind {
    kName,
    kConstant,
    kFString,
    kList,
    kTuple,
    kDict,
    kSet,
    kListComp,
    kSetComp,
    kDictComp,
    kGenerator,
    kUnaryOp,
    kBinaryOp,
    kBoolOp,
    kCompare,
    kIfExp,
    kLambda,
    kCall,
    kAttribute,
    kSubscript,
    kSlice,
    kStarred
};

enum class BinaryOperator {
    kAdd,
    kSub,
    kMul,
    kDiv,
    kFloorDiv,
    kMod,
    kPow,
    kLShift,
    kRShift,
    kBitOr,
    kBitXor,
    kBitAnd
};

enum class UnaryOperator {
    kNot,
    kNeg,
    kPos,
    kInvert
};

enum class CompareOperator {
    kEq,
    kNotEq,
    kLt,
    kLtE,
    kGt,
    kGtE,
    kIn,
    kNotIn,
    kIs,
    kIsNot
};

const char* ToString(BinaryOperator op);
const char* ToString(CompareOperator op);

struct Expr;
struct Stmt;
struct ClassDef;
using ExprPtr = std::unique_ptr<Expr>;
using StmtPtr = std::unique_ptr<Stmt>;

struct Comprehension {
    ExprPtr target;
    ExprPtr iter;
    std::vector<ExprPtr> conditions;
};

struct KeywordArg {
    std::string name;
    ExprPtr value;
};

struct FStringPart {
    std::string literal;
    ExprPtr expr;           // null for literal-only parts
    char conversion = 0;    // 'r', 's' or 0
    std::string format_spec;
};

// Child layout by kind:
//   kList/kTuple/kSet         children = elements
//   kDict                     children = key0, value0, key1, value1, ...
//   kListComp/kSetComp/kGenerator children[0] = element
//   kDictComp                 children[0] = key, children[1] = value
//   kUnaryOp                  children[0] = operand
//   kBinaryOp                 children[0], children[1]
//   kBoolOp                   children = operands (is_and selects and/or)
//   kCompare                  children = operands, compare_ops between them
//   kIfExp                    children = test, body, orelse
//   kCall                     children[0] = callee, rest = positional args
//   kAttribute                children[0] = object, name = attribute
//   kSubscript                children[0] = object, children[1] = index
//   kSlice                    children = lower, upper, step (entries may be null)
//   kStarred                  children[0] = value
struct Expr {
    ExprKind kind = ExprKind::kConstant;
    int line = 0;
    int column = 0;
    std::string name;
    Value constant;
    BinaryOperator binary_op = BinaryOperator::kAdd;
    UnaryOperator unary_op = UnaryOperator::kNot;
    bool is_and = false;
    std::vector<CompareOperator> compare_ops;
    std::vector<ExprPtr> children;
    std::vector<KeywordArg> keywords;
    std::vector<Comprehension> generators;
    std::vector<FStringPart> fstring_parts;
    std::shared_ptr<FunctionDef> function;
};

enum class StmtKind {
    kExpr,
    kAssign,
    kAugAssign,
    kReturn,
    kIf,
    kWhile,
    kFor,
    kBreak,
    kContinue,
    kPass,
    kFunctionDef,
    kClassDef,
    kTry,
    kRaise,
    kAssert,
    kDelete,
    kGlobal,
    kNonlocal,
    kImport
};

struct ExceptHandler {
    ExprPtr type;  // null for a bare except
    std::string name;
    std::vector<StmtPtr> body;
    int line = 0;
};

// Field use by kind:
//   kExpr        value
//   kAssign      targets (chained), value
//   kAugAssign   target, binary_op, value
//   kReturn      value (may be null)
//   kIf/kWhile   test, body, orelse
//   kFor         target, value (iterable), body, orelse
//   kFunctionDef function
//   kClassDef    class_def
//   kTry         body, handlers, orelse, finalbody
//   kRaise       value (may be null), cause (may be null)
//   kAssert      test, value (message, may be null)
//   kDelete      targets
//   kGlobal/kNonlocal names
//   kImport      names (module names as written)
struct Stmt {
    StmtKind kind = StmtKind::kPass;
    int line = 0;
    int column = 0;
    std::vector<ExprPtr> targets;
    ExprPtr target;
    ExprPtr value;
    ExprPtr test;
    ExprPtr cause;
    BinaryOperator binary_op = BinaryOperator::kAdd;
    std::vector<StmtPtr> body;
    std::vector<StmtPtr> orelse;
    std::vector<StmtPtr> finalbody;
    std::vector<ExceptHandler> handlers;
    std::shared_ptr<FunctionDef> function;
    std::shared_ptr<ClassDef> class_def;
    std::vector<std::string> names;
};

struct FunctionDef {
    std::string name;
    int line = 0;
    std::vector<std::string> params;
    // Defaults bind to the last defaults.size() params.
    std::vector<ExprPtr> defaults;
    std::string vararg;
    std::vector<StmtPtr> body;
    bool is_lambda = false;

    // Filled by the parser once the body is complete.
    std::unordered_set<std::string> local_names;
    std::unordered_set<std::string> global_names;
    std::unordered_set<std::string> nonlocal_names;
};

struct ClassDef {
    std::string name;
    int line = 0;
    std::vector<ExprPtr> bases;
    std::vector<StmtPtr> body;
};

struct Program {
    std::vector<StmtPtr> body;
};

}  // namespace evalbox::lang
