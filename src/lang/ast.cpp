#include "lang/ast.hpp"

namespace evalbox::lang {

const char* ToString(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::kAdd: return "+";
        case BinaryOperator::kSub: return "-";
        case BinaryOperator::kMul: return "*";
        case BinaryOperator::kDiv: return "/";
        case BinaryOperator::kFloorDiv: return "//";
        case BinaryOperator::kMod: return "%";
        case BinaryOperator::kPow: return "** or pow()";
        case BinaryOperator::kLShift: return "<<";
        case BinaryOperator::kRShift: return ">>";
        case BinaryOperator::kBitOr: return "|";
        case BinaryOperator::kBitXor: return "^";
        case BinaryOperator::kBitAnd: return "&";
    }
    return "?";
}

const char* ToString(CompareOperator op) {
    switch (op) {
        case CompareOperator::kEq: return "==";
        case CompareOperator::kNotEq: return "!=";
        case CompareOperator::kLt: return "<";
        case CompareOperator::kLtE: return "<=";
        case CompareOperator::kGt: return ">";
        case CompareOperator::kGtE: return ">=";
        case CompareOperator::kIn: return "in";
        case CompareOperator::kNotIn: return "not in";
        case CompareOperator::kIs: return "is";
        case CompareOperator::kIsNot: return "is not";
    }
    return "?";
}

}  // namespace evalbox::lang
