#pragma once

#include <cstdint>
#include <optional>

#include "lang/ast.hpp"
#include "lang/value.hpp"

namespace evalbox::lang {

class Interpreter;

struct SliceSpec {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;
    std::optional<std::int64_t> step;
};

// Arithmetic, bitwise and sequence operators with Python semantics. All of
// them raise ScriptException on type errors, overflow and division by zero.
Value BinaryOperation(Interpreter& interpreter, BinaryOperator op, const Value& lhs, const Value& rhs);
Value UnaryOperation(UnaryOperator op, const Value& operand);
bool CompareOperation(Interpreter& interpreter, CompareOperator op, const Value& lhs, const Value& rhs);
bool Contains(Interpreter& interpreter, const Value& container, const Value& item);
bool IsSame(const Value& lhs, const Value& rhs);

Value GetItem(const Value& object, const Value& index);
Value GetSlice(const Value& object, const SliceSpec& slice);
void SetItem(Interpreter& interpreter, const Value& object, const Value& index, Value value);
void SetSlice(Interpreter& interpreter, const Value& object, const SliceSpec& slice, const Value& value);
void DeleteItem(const Value& object, const Value& index);
void DeleteSlice(const Value& object, const SliceSpec& slice);

// Converts a slice bound (int, bool or None).
std::optional<std::int64_t> SliceBound(const Value& bound);
// Bounds of a slice object, as x[slice(a, b, c)] uses them.
SliceSpec ToSliceSpec(const Value& slice);
// Resolves a slice against a sequence length into the selected indices.
std::vector<std::int64_t> SliceIndices(const SliceSpec& slice, std::int64_t length);

std::int64_t CheckedAdd(std::int64_t lhs, std::int64_t rhs);
std::int64_t CheckedMultiply(std::int64_t lhs, std::int64_t rhs);
std::int64_t FloorDivide(std::int64_t lhs, std::int64_t rhs);
std::int64_t FloorModulo(std::int64_t lhs, std::int64_t rhs);

}  // namespace evalbox::lang
