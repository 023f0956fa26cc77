#include "lang/operators.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "lang/interpreter.hpp"
#include "lang/methods.hpp"
#include "lang/script_error.hpp"

namespace evalbox::lang {
namespace {

[[noreturn]] void ThrowUnsupported(BinaryOperator op, const Value& lhs, const Value& rhs) {
    ThrowError("TypeError", std::string("unsupported operand type(s) for ") + ToString(op) + ": '" +
                                TypeName(lhs) + "' and '" + TypeName(rhs) + "'");
}

const std::vector<Value>* SequenceItems(const Value& value) {
    if (value.kind() == ValueKind::kList) {
        return &value.AsList()->items;
    }
    if (value.kind() == ValueKind::kTuple) {
        return &value.AsTuple()->items;
    }
    return nullptr;
}

Value MakeSequence(ValueKind kind, std::vector<Value> items) {
    return kind == ValueKind::kList ? Value::List(std::move(items)) : Value::Tuple(std::move(items));
}

Value Repeat(Interpreter& interpreter, const Value& sequence, std::int64_t times) {
    if (times < 0) {
        times = 0;
    }
    if (sequence.IsStr()) {
        const auto& text = sequence.AsStr();
        if (!text.empty()) {
            interpreter.CheckContainerSize(static_cast<std::size_t>(CheckedMultiply(
                static_cast<std::int64_t>(text.size()), times)));
        }
        std::string out;
        out.reserve(text.size() * static_cast<std::size_t>(times));
        for (std::int64_t i = 0; i < times; ++i) {
            out += text;
        }
        return Value::Str(std::move(out));
    }
    const auto& items = *SequenceItems(sequence);
    if (!items.empty()) {
        interpreter.CheckContainerSize(
            static_cast<std::size_t>(CheckedMultiply(static_cast<std::int64_t>(items.size()), times)));
    }
    std::vector<Value> out;
    out.reserve(items.size() * static_cast<std::size_t>(times));
    for (std::int64_t i = 0; i < times; ++i) {
        out.insert(out.end(), items.begin(), items.end());
    }
    return MakeSequence(sequence.kind(), std::move(out));
}

bool IsSequence(const Value& value) {
    return value.IsStr() || value.kind() == ValueKind::kList || value.kind() == ValueKind::kTuple;
}

Value IntegerPower(std::int64_t base, std::int64_t exponent) {
    if (exponent < 0) {
        if (base == 0) {
            ThrowError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
        }
        return Value::Float(std::pow(static_cast<double>(base), static_cast<double>(exponent)));
    }
    std::int64_t result = 1;
    while (exponent > 0) {
        if (exponent & 1) {
            result = CheckedMultiply(result, base);
        }
        exponent >>= 1;
        if (exponent > 0) {
            base = CheckedMultiply(base, base);
        }
    }
    return Value::Int(result);
}

std::optional<Value> CallSpecial(const Value& self, const char* name, std::vector<Value> args) {
    if (self.kind() != ValueKind::kInstance) {
        return std::nullopt;
    }
    auto* hooks = CurrentHooks();
    if (hooks == nullptr) {
        return std::nullopt;
    }
    return hooks->CallSpecial(self, name, std::move(args));
}

Value SliceValue(const SliceSpec& slice) {
    auto bound = [](const std::optional<std::int64_t>& value) {
        return value ? Value::Int(*value) : Value::None();
    };
    return Value::Slice(bound(slice.start), bound(slice.stop), bound(slice.step));
}

// The method and its reflected twin.
std::pair<const char*, const char*> SpecialNames(BinaryOperator op) {
    switch (op) {
        case BinaryOperator::kAdd: return {"__add__", "__radd__"};
        case BinaryOperator::kSub: return {"__sub__", "__rsub__"};
        case BinaryOperator::kMul: return {"__mul__", "__rmul__"};
        case BinaryOperator::kDiv: return {"__truediv__", "__rtruediv__"};
        case BinaryOperator::kFloorDiv: return {"__floordiv__", "__rfloordiv__"};
        case BinaryOperator::kMod: return {"__mod__", "__rmod__"};
        case BinaryOperator::kPow: return {"__pow__", "__rpow__"};
        case BinaryOperator::kLShift: return {"__lshift__", "__rlshift__"};
        case BinaryOperator::kRShift: return {"__rshift__", "__rrshift__"};
        case BinaryOperator::kBitOr: return {"__or__", "__ror__"};
        case BinaryOperator::kBitXor: return {"__xor__", "__rxor__"};
        case BinaryOperator::kBitAnd: return {"__and__", "__rand__"};
    }
    return {"", ""};
}

// A frozenset on the left keeps the result frozen, as in Python.
Value SetOperation(BinaryOperator op, const Value& left, const Value& right) {
    const SetObject& lhs = *left.AsSet();
    const SetObject& rhs = *right.AsSet();
    auto result = left.kind() == ValueKind::kFrozenSet ? Value::FrozenSet() : Value::Set();
    auto& out = *result.AsSet();
    switch (op) {
        case BinaryOperator::kBitOr:
            for (const auto& item : lhs.items) {
                out.Add(item);
            }
            for (const auto& item : rhs.items) {
                out.Add(item);
            }
            break;
        case BinaryOperator::kBitAnd:
            for (const auto& item : lhs.items) {
                if (rhs.Contains(item)) {
                    out.Add(item);
                }
            }
            break;
        case BinaryOperator::kSub:
            for (const auto& item : lhs.items) {
                if (!rhs.Contains(item)) {
                    out.Add(item);
                }
            }
            break;
        default:
            for (const auto& item : lhs.items) {
                if (!rhs.Contains(item)) {
                    out.Add(item);
                }
            }
            for (const auto& item : rhs.items) {
                if (!lhs.Contains(item)) {
                    out.Add(item);
                }
            }
    }
    return result;
}

Value NumericOperation(BinaryOperator op, const Value& lhs, const Value& rhs) {
    const bool integral = lhs.IsIntegral() && rhs.IsIntegral();
    if (integral) {
        const std::int64_t a = lhs.AsInt();
        const std::int64_t b = rhs.AsInt();
        switch (op) {
            case BinaryOperator::kAdd:
                return Value::Int(CheckedAdd(a, b));
            case BinaryOperator::kSub: {
                std::int64_t result = 0;
                if (__builtin_sub_overflow(a, b, &result)) {
                    ThrowError("OverflowError", "integer overflow");
                }
                return Value::Int(result);
            }
            case BinaryOperator::kMul:
                return Value::Int(CheckedMultiply(a, b));
            case BinaryOperator::kDiv:
                if (b == 0) {
                    ThrowError("ZeroDivisionError", "division by zero");
                }
                return Value::Float(static_cast<double>(a) / static_cast<double>(b));
            case BinaryOperator::kFloorDiv:
                return Value::Int(FloorDivide(a, b));
            case BinaryOperator::kMod:
                return Value::Int(FloorModulo(a, b));
            case BinaryOperator::kPow:
                return IntegerPower(a, b);
            case BinaryOperator::kLShift: {
                if (b < 0) {
                    ThrowError("ValueError", "negative shift count");
                }
                if (a == 0) {
                    return Value::Int(0);
                }
                if (b >= 63) {
                    ThrowError("OverflowError", "integer overflow");
                }
                const std::int64_t shifted = static_cast<std::int64_t>(static_cast<std::uint64_t>(a) << b);
                if ((shifted >> b) != a) {
                    ThrowError("OverflowError", "integer overflow");
                }
                return Value::Int(shifted);
            }
            case BinaryOperator::kRShift:
                if (b < 0) {
                    ThrowError("ValueError", "negative shift count");
                }
                return Value::Int(b >= 63 ? (a < 0 ? -1 : 0) : (a >> b));
            case BinaryOperator::kBitOr:
                return lhs.IsBool() && rhs.IsBool() ? Value::Bool((a | b) != 0) : Value::Int(a | b);
            case BinaryOperator::kBitXor:
                return lhs.IsBool() && rhs.IsBool() ? Value::Bool((a ^ b) != 0) : Value::Int(a ^ b);
            case BinaryOperator::kBitAnd:
                return lhs.IsBool() && rhs.IsBool() ? Value::Bool((a & b) != 0) : Value::Int(a & b);
        }
    }

    const double a = lhs.AsDouble();
    const double b = rhs.AsDouble();
    switch (op) {
        case BinaryOperator::kAdd:
            return Value::Float(a + b);
        case BinaryOperator::kSub:
            return Value::Float(a - b);
        case BinaryOperator::kMul:
            return Value::Float(a * b);
        case BinaryOperator::kDiv:
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float division by zero");
            }
            return Value::Float(a / b);
        case BinaryOperator::kFloorDiv:
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float floor division by zero");
            }
            return Value::Float(std::floor(a / b));
        case BinaryOperator::kMod: {
            if (b == 0.0) {
                ThrowError("ZeroDivisionError", "float modulo");
            }
            double result = std::fmod(a, b);
            if (result != 0.0 && ((result < 0) != (b < 0))) {
                result += b;
            }
            return Value::Float(result);
        }
        case BinaryOperator::kPow: {
            if (a == 0.0 && b < 0) {
                ThrowError("ZeroDivisionError", "0.0 cannot be raised to a negative power");
            }
            if (a < 0 && std::trunc(b) != b) {
                ThrowError("ValueError", "math domain error");
            }
            const double result = std::pow(a, b);
            if (std::isinf(result) && std::isfinite(a) && std::isfinite(b)) {
                ThrowError("OverflowError", "(34, 'Numerical result out of range')");
            }
            return Value::Float(result);
        }
        default:
            ThrowUnsupported(op, lhs, rhs);
    }
}

// Clamps start/stop the way Python's slice.indices() does and returns the
// normalized step.
std::int64_t AdjustSlice(const SliceSpec& slice, std::int64_t length, std::int64_t& start, std::int64_t& stop) {
    const std::int64_t step = slice.step.value_or(1);
    if (step == 0) {
        ThrowError("ValueError", "slice step cannot be zero");
    }
    const std::int64_t lower = step > 0 ? 0 : -1;
    const std::int64_t upper = step > 0 ? length : length - 1;
    auto clamp = [&](std::optional<std::int64_t> bound, std::int64_t fallback) {
        if (!bound) {
            return fallback;
        }
        std::int64_t value = *bound;
        if (value < 0) {
            value += length;
            return value < lower ? lower : value;
        }
        return value > upper ? upper : value;
    };
    start = clamp(slice.start, step > 0 ? lower : upper);
    stop = clamp(slice.stop, step > 0 ? upper : lower);
    return step;
}

// start + index * step for a clamped slice bound, which may sit one step
// outside the range and so past int64.
std::int64_t RangeBound(const RangeObject& range, std::int64_t index) {
    const __int128 bound = static_cast<__int128>(range.start) + static_cast<__int128>(index) * range.step;
    if (bound < std::numeric_limits<std::int64_t>::min() || bound > std::numeric_limits<std::int64_t>::max()) {
        ThrowError("OverflowError", "Python int too large to convert to C long");
    }
    return static_cast<std::int64_t>(bound);
}

std::int64_t NormalizeIndex(const Value& index, std::int64_t length, const std::string& type_name) {
    if (!index.IsIntegral()) {
        ThrowError("TypeError", type_name + " indices must be integers or slices, not " + TypeName(index));
    }
    std::int64_t position = index.AsInt();
    if (position < 0) {
        position += length;
    }
    if (position < 0 || position >= length) {
        ThrowError("IndexError", type_name + " index out of range");
    }
    return position;
}

}  // namespace

std::int64_t CheckedAdd(std::int64_t lhs, std::int64_t rhs) {
    std::int64_t result = 0;
    if (__builtin_add_overflow(lhs, rhs, &result)) {
        ThrowError("OverflowError", "integer overflow");
    }
    return result;
}

std::int64_t CheckedMultiply(std::int64_t lhs, std::int64_t rhs) {
    std::int64_t result = 0;
    if (__builtin_mul_overflow(lhs, rhs, &result)) {
        ThrowError("OverflowError", "integer overflow");
    }
    return result;
}

std::int64_t FloorDivide(std::int64_t lhs, std::int64_t rhs) {
    if (rhs == 0) {
        ThrowError("ZeroDivisionError", "integer division or modulo by zero");
    }
    if (lhs == std::numeric_limits<std::int64_t>::min() && rhs == -1) {
        ThrowError("OverflowError", "integer overflow");
    }
    std::int64_t quotient = lhs / rhs;
    if ((lhs % rhs != 0) && ((lhs < 0) != (rhs < 0))) {
        --quotient;
    }
    return quotient;
}

std::int64_t FloorModulo(std::int64_t lhs, std::int64_t rhs) {
    if (rhs == 0) {
        ThrowError("ZeroDivisionError", "integer modulo by zero");
    }
    if (rhs == -1) {
        return 0;
    }
    std::int64_t remainder = lhs % rhs;
    if (remainder != 0 && ((remainder < 0) != (rhs < 0))) {
        remainder += rhs;
    }
    return remainder;
}

Value BinaryOperation(Interpreter& interpreter, BinaryOperator op, const Value& lhs, const Value& rhs) {
    if (lhs.kind() == ValueKind::kInstance || rhs.kind() == ValueKind::kInstance) {
        const auto names = SpecialNames(op);
        if (auto result = CallSpecial(lhs, names.first, {rhs})) {
            return *result;
        }
        if (auto result = CallSpecial(rhs, names.second, {lhs})) {
            return *result;
        }
        ThrowUnsupported(op, lhs, rhs);
    }
    if (lhs.IsNumber() && rhs.IsNumber()) {
        if (!lhs.IsIntegral() || !rhs.IsIntegral()) {
            switch (op) {
                case BinaryOperator::kLShift:
                case BinaryOperator::kRShift:
                case BinaryOperator::kBitOr:
                case BinaryOperator::kBitXor:
                case BinaryOperator::kBitAnd:
                    ThrowUnsupported(op, lhs, rhs);
                default:
                    break;
            }
        }
        return NumericOperation(op, lhs, rhs);
    }

    switch (op) {
        case BinaryOperator::kAdd:
            if (lhs.IsStr()) {
                if (!rhs.IsStr()) {
                    ThrowError("TypeError", "can only concatenate str (not \"" + TypeName(rhs) + "\") to str");
                }
                interpreter.CheckContainerSize(lhs.AsStr().size() + rhs.AsStr().size());
                return Value::Str(lhs.AsStr() + rhs.AsStr());
            }
            if (lhs.kind() == ValueKind::kList || lhs.kind() == ValueKind::kTuple) {
                if (rhs.kind() != lhs.kind()) {
                    const auto name = TypeName(lhs);
                    ThrowError("TypeError",
                               "can only concatenate " + name + " (not \"" + TypeName(rhs) + "\") to " + name);
                }
                const auto& left = *SequenceItems(lhs);
                const auto& right = *SequenceItems(rhs);
                interpreter.CheckContainerSize(left.size() + right.size());
                std::vector<Value> items;
                items.reserve(left.size() + right.size());
                items.insert(items.end(), left.begin(), left.end());
                items.insert(items.end(), right.begin(), right.end());
                return MakeSequence(lhs.kind(), std::move(items));
            }
            break;
        case BinaryOperator::kMul:
            if (IsSequence(lhs) && rhs.IsIntegral()) {
                return Repeat(interpreter, lhs, rhs.AsInt());
            }
            if (lhs.IsIntegral() && IsSequence(rhs)) {
                return Repeat(interpreter, rhs, lhs.AsInt());
            }
            if (IsSequence(lhs) && rhs.IsNumber()) {
                ThrowError("TypeError", "can't multiply sequence by non-int of type '" + TypeName(rhs) + "'");
            }
            break;
        case BinaryOperator::kMod:
            if (lhs.IsStr()) {
                return Value::Str(PercentFormat(lhs.AsStr(), rhs));
            }
            break;
        case BinaryOperator::kSub:
        case BinaryOperator::kBitAnd:
        case BinaryOperator::kBitXor:
            if (lhs.IsAnySet() && rhs.IsAnySet()) {
                return SetOperation(op, lhs, rhs);
            }
            break;
        case BinaryOperator::kBitOr:
            if (lhs.IsAnySet() && rhs.IsAnySet()) {
                return SetOperation(op, lhs, rhs);
            }
            if (lhs.kind() == ValueKind::kDict && rhs.kind() == ValueKind::kDict) {
                auto merged = Value::Dict();
                auto& out = *merged.AsDict();
                for (const auto& entry : lhs.AsDict()->entries) {
                    out.Set(entry.first, entry.second);
                }
                for (const auto& entry : rhs.AsDict()->entries) {
                    out.Set(entry.first, entry.second);
                }
                return merged;
            }
            break;
        default:
            break;
    }
    ThrowUnsupported(op, lhs, rhs);
}

Value UnaryOperation(UnaryOperator op, const Value& operand) {
    if (operand.kind() == ValueKind::kInstance && op != UnaryOperator::kNot) {
        const char* name = op == UnaryOperator::kNeg ? "__neg__" : (op == UnaryOperator::kPos ? "__pos__" : "__invert__");
        if (auto result = CallSpecial(operand, name, {})) {
            return *result;
        }
    }
    switch (op) {
        case UnaryOperator::kNot:
            return Value::Bool(!Truthy(operand));
        case UnaryOperator::kNeg:
            if (operand.IsIntegral()) {
                const auto value = operand.AsInt();
                if (value == std::numeric_limits<std::int64_t>::min()) {
                    ThrowError("OverflowError", "integer overflow");
                }
                return Value::Int(-value);
            }
            if (operand.IsFloat()) {
                return Value::Float(-operand.AsDouble());
            }
            ThrowError("TypeError", "bad operand type for unary -: '" + TypeName(operand) + "'");
        case UnaryOperator::kPos:
            if (operand.IsIntegral()) {
                return Value::Int(operand.AsInt());
            }
            if (operand.IsFloat()) {
                return operand;
            }
            ThrowError("TypeError", "bad operand type for unary +: '" + TypeName(operand) + "'");
        case UnaryOperator::kInvert:
            if (operand.IsIntegral()) {
                return Value::Int(~operand.AsInt());
            }
            ThrowError("TypeError", "bad operand type for unary ~: '" + TypeName(operand) + "'");
    }
    return Value::None();
}

bool IsSame(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case ValueKind::kNone:
            return true;
        case ValueKind::kBool:
        case ValueKind::kInt:
        case ValueKind::kFloat:
        case ValueKind::kStr:
            return Equals(lhs, rhs);
        default:
            return lhs.Identity() == rhs.Identity();
    }
}

bool Contains(Interpreter& interpreter, const Value& container, const Value& item) {
    switch (container.kind()) {
        case ValueKind::kStr:
            if (!item.IsStr()) {
                ThrowError("TypeError", "'in <string>' requires string as left operand, not " + TypeName(item));
            }
            return container.AsStr().find(item.AsStr()) != std::string::npos;
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = *SequenceItems(container);
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (Equals(items[i], item)) {
                    return true;
                }
            }
            return false;
        }
        case ValueKind::kDict:
            return container.AsDict()->Find(item) != nullptr;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
            Hash(item);
            return container.AsSet()->Contains(item);
        case ValueKind::kRange: {
            if (!item.IsNumber()) {
                return false;
            }
            if (item.IsFloat() && (std::trunc(item.AsDouble()) != item.AsDouble() ||
                                   item.AsDouble() < -9223372036854775808.0 ||
                                   item.AsDouble() >= 9223372036854775808.0)) {
                return false;
            }
            const auto range = container.AsRange();
            const auto value = item.IsFloat() ? static_cast<std::int64_t>(item.AsDouble()) : item.AsInt();
            if (range->step > 0 ? (value < range->start || value >= range->stop)
                                : (value > range->start || value <= range->stop)) {
                return false;
            }
            if (range->step > 0) {
                const std::uint64_t offset =
                    static_cast<std::uint64_t>(value) - static_cast<std::uint64_t>(range->start);
                return offset % static_cast<std::uint64_t>(range->step) == 0;
            }
            const std::uint64_t offset = static_cast<std::uint64_t>(range->start) - static_cast<std::uint64_t>(value);
            return offset % (static_cast<std::uint64_t>(-(range->step + 1)) + 1) == 0;
        }
        case ValueKind::kInstance: {
            if (auto result = CallSpecial(container, "__contains__", {item})) {
                return Truthy(*result);
            }
            auto next = interpreter.MakeIterator(container);
            while (auto value = next()) {
                interpreter.Tick();
                if (Equals(*value, item)) {
                    return true;
                }
            }
            return false;
        }
        case ValueKind::kIterator: {
            auto next = interpreter.MakeIterator(container);
            while (auto value = next()) {
                interpreter.Tick();
                if (Equals(*value, item)) {
                    return true;
                }
            }
            return false;
        }
        default:
            ThrowError("TypeError", "argument of type '" + TypeName(container) + "' is not iterable");
    }
}

bool CompareOperation(Interpreter& interpreter, CompareOperator op, const Value& lhs, const Value& rhs) {
    switch (op) {
        case CompareOperator::kEq:
            return Equals(lhs, rhs);
        case CompareOperator::kNotEq:
            return !Equals(lhs, rhs);
        case CompareOperator::kIn:
            return Contains(interpreter, rhs, lhs);
        case CompareOperator::kNotIn:
            return !Contains(interpreter, rhs, lhs);
        case CompareOperator::kIs:
            return IsSame(lhs, rhs);
        case CompareOperator::kIsNot:
            return !IsSame(lhs, rhs);
        default:
            break;
    }

    if (lhs.IsNumber() && rhs.IsNumber() && (lhs.IsFloat() || rhs.IsFloat())) {
        const double a = lhs.AsDouble();
        const double b = rhs.AsDouble();
        switch (op) {
            case CompareOperator::kLt: return a < b;
            case CompareOperator::kLtE: return a <= b;
            case CompareOperator::kGt: return a > b;
            default: return a >= b;
        }
    }
    if (lhs.IsAnySet() && rhs.IsAnySet()) {
        switch (op) {
            case CompareOperator::kLt: return LessThan(lhs, rhs);
            case CompareOperator::kGt: return LessThan(rhs, lhs);
            case CompareOperator::kLtE: return LessThan(lhs, rhs) || Equals(lhs, rhs);
            default: return LessThan(rhs, lhs) || Equals(lhs, rhs);
        }
    }
    const int order = CompareValues(lhs, rhs, ToString(op));
    switch (op) {
        case CompareOperator::kLt: return order < 0;
        case CompareOperator::kLtE: return order <= 0;
        case CompareOperator::kGt: return order > 0;
        default: return order >= 0;
    }
}

std::optional<std::int64_t> SliceBound(const Value& bound) {
    if (bound.IsNone()) {
        return std::nullopt;
    }
    if (!bound.IsIntegral()) {
        ThrowError("TypeError", "slice indices must be integers or None or have an __index__ method");
    }
    return bound.AsInt();
}

std::vector<std::int64_t> SliceIndices(const SliceSpec& slice, std::int64_t length) {
    std::int64_t start = 0;
    std::int64_t stop = 0;
    const std::int64_t step = AdjustSlice(slice, length, start, stop);
    // start and stop are clamped to [-1, length], so every offset k * step
    // below the count stays within that window.
    const std::uint64_t count = StepCount(start, stop, step);
    std::vector<std::int64_t> indices;
    indices.reserve(static_cast<std::size_t>(count));
    for (std::uint64_t k = 0; k < count; ++k) {
        indices.push_back(start + static_cast<std::int64_t>(k) * step);
    }
    return indices;
}

SliceSpec ToSliceSpec(const Value& slice) {
    const auto object = slice.AsSlice();
    return SliceSpec{SliceBound(object->start), SliceBound(object->stop), SliceBound(object->step)};
}

Value GetItem(const Value& object, const Value& index) {
    if (index.kind() == ValueKind::kSlice && object.kind() != ValueKind::kInstance &&
        object.kind() != ValueKind::kDict) {
        return GetSlice(object, ToSliceSpec(index));
    }
    switch (object.kind()) {
        case ValueKind::kList: {
            const auto& items = object.AsList()->items;
            return items[NormalizeIndex(index, static_cast<std::int64_t>(items.size()), "list")];
        }
        case ValueKind::kTuple: {
            const auto& items = object.AsTuple()->items;
            return items[NormalizeIndex(index, static_cast<std::int64_t>(items.size()), "tuple")];
        }
        case ValueKind::kStr: {
            if (!index.IsIntegral()) {
                ThrowError("TypeError", "string indices must be integers, not '" + TypeName(index) + "'");
            }
            const auto& text = object.AsStr();
            if (IsAscii(text)) {
                return Value::Str(
                    std::string(1, text[NormalizeIndex(index, static_cast<std::int64_t>(text.size()), "string")]));
            }
            const auto code_points = DecodeUtf8(text);
            const auto position = NormalizeIndex(index, static_cast<std::int64_t>(code_points.size()), "string");
            return Value::Str(EncodeUtf8(code_points[position]));
        }
        case ValueKind::kRange: {
            const auto range = object.AsRange();
            if (!index.IsIntegral()) {
                ThrowError("TypeError", "range indices must be integers or slices, not " + TypeName(index));
            }
            const std::int64_t position = index.AsInt();
            const std::uint64_t count = range->Count();
            std::uint64_t offset = 0;
            if (position < 0) {
                const std::uint64_t back = 0 - static_cast<std::uint64_t>(position);
                if (back > count) {
                    ThrowError("IndexError", "range object index out of range");
                }
                offset = count - back;
            } else {
                offset = static_cast<std::uint64_t>(position);
                if (offset >= count) {
                    ThrowError("IndexError", "range object index out of range");
                }
            }
            return Value::Int(range->At(offset));
        }
        case ValueKind::kDict: {
            const auto* found = object.AsDict()->Find(index);
            if (found == nullptr) {
                ThrowKeyError(index);
            }
            return *found;
        }
        default:
            if (auto result = CallSpecial(object, "__getitem__", {index})) {
                return *result;
            }
            ThrowError("TypeError", "'" + TypeName(object) + "' object is not subscriptable");
    }
}

Value GetSlice(const Value& object, const SliceSpec& slice) {
    switch (object.kind()) {
        case ValueKind::kList:
        case ValueKind::kTuple: {
            const auto& items = *SequenceItems(object);
            std::vector<Value> out;
            for (const auto index : SliceIndices(slice, static_cast<std::int64_t>(items.size()))) {
                out.push_back(items[index]);
            }
            return MakeSequence(object.kind(), std::move(out));
        }
        case ValueKind::kStr: {
            const auto& text = object.AsStr();
            std::string out;
            if (IsAscii(text)) {
                for (const auto index : SliceIndices(slice, static_cast<std::int64_t>(text.size()))) {
                    out.push_back(text[index]);
                }
                return Value::Str(std::move(out));
            }
            const auto code_points = DecodeUtf8(text);
            std::u32string selected;
            for (const auto index : SliceIndices(slice, static_cast<std::int64_t>(code_points.size()))) {
                selected.push_back(code_points[index]);
            }
            return Value::Str(EncodeUtf8(selected));
        }
        case ValueKind::kRange: {
            const auto range = object.AsRange();
            std::int64_t start = 0;
            std::int64_t stop = 0;
            const auto step = AdjustSlice(slice, range->Length(), start, stop);
            return Value::Range(RangeBound(*range, start), RangeBound(*range, stop),
                                CheckedMultiply(range->step, step));
        }
        default:
            if (auto result = CallSpecial(object, "__getitem__", {SliceValue(slice)})) {
                return *result;
            }
            ThrowError("TypeError", "'" + TypeName(object) + "' object is not subscriptable");
    }
}

void SetItem(Interpreter& interpreter, const Value& object, const Value& index, Value value) {
    if (index.kind() == ValueKind::kSlice && object.kind() == ValueKind::kList) {
        SetSlice(interpreter, object, ToSliceSpec(index), value);
        return;
    }
    switch (object.kind()) {
        case ValueKind::kList: {
            auto& items = object.AsList()->items;
            items[NormalizeIndex(index, static_cast<std::int64_t>(items.size()), "list assignment")] =
                std::move(value);
            return;
        }
        case ValueKind::kDict: {
            auto dict = object.AsDict();
            dict->Set(index, std::move(value));
            interpreter.CheckContainerSize(dict->size());
            return;
        }
        default:
            if (CallSpecial(object, "__setitem__", {index, std::move(value)})) {
                return;
            }
            ThrowError("TypeError", "'" + TypeName(object) + "' object does not support item assignment");
    }
}

void SetSlice(Interpreter& interpreter, const Value& object, const SliceSpec& slice, const Value& value) {
    if (object.kind() == ValueKind::kInstance && CallSpecial(object, "__setitem__", {SliceValue(slice), value})) {
        return;
    }
    if (object.kind() != ValueKind::kList) {
        ThrowError("TypeError", "'" + TypeName(object) + "' object does not support item assignment");
    }
    auto& items = object.AsList()->items;
    auto replacement = interpreter.Materialize(value);
    const auto length = static_cast<std::int64_t>(items.size());
    std::int64_t start = 0;
    std::int64_t stop = 0;
    const auto step = AdjustSlice(slice, length, start, stop);
    if (step == 1) {
        stop = std::max(stop, start);
        interpreter.CheckContainerSize(items.size() - static_cast<std::size_t>(stop - start) + replacement.size());
        items.erase(items.begin() + start, items.begin() + stop);
        items.insert(items.begin() + start, replacement.begin(), replacement.end());
        return;
    }
    const auto indices = SliceIndices(slice, length);
    if (indices.size() != replacement.size()) {
        ThrowError("ValueError", "attempt to assign sequence of size " + std::to_string(replacement.size()) +
                                     " to extended slice of size " + std::to_string(indices.size()));
    }
    for (std::size_t i = 0; i < indices.size(); ++i) {
        items[indices[i]] = std::move(replacement[i]);
    }
}

void DeleteItem(const Value& object, const Value& index) {
    if (index.kind() == ValueKind::kSlice && object.kind() == ValueKind::kList) {
        DeleteSlice(object, ToSliceSpec(index));
        return;
    }
    switch (object.kind()) {
        case ValueKind::kList: {
            auto& items = object.AsList()->items;
            const auto position = NormalizeIndex(index, static_cast<std::int64_t>(items.size()), "list assignment");
            items.erase(items.begin() + position);
            return;
        }
        case ValueKind::kDict:
            if (!object.AsDict()->Erase(index)) {
                ThrowKeyError(index);
            }
            return;
        default:
            if (CallSpecial(object, "__delitem__", {index})) {
                return;
            }
            ThrowError("TypeError", "'" + TypeName(object) + "' object doesn't support item deletion");
    }
}

void DeleteSlice(const Value& object, const SliceSpec& slice) {
    if (object.kind() == ValueKind::kInstance && CallSpecial(object, "__delitem__", {SliceValue(slice)})) {
        return;
    }
    if (object.kind() != ValueKind::kList) {
        ThrowError("TypeError", "'" + TypeName(object) + "' object doesn't support item deletion");
    }
    auto& items = object.AsList()->items;
    auto indices = SliceIndices(slice, static_cast<std::int64_t>(items.size()));
    std::sort(indices.begin(), indices.end());
    for (auto it = indices.rbegin(); it != indices.rend(); ++it) {
        items.erase(items.begin() + *it);
    }
}

}  // namespace evalbox::lang
