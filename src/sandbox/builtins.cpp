#include "sandbox/builtins.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <limits>

#include "lang/interpreter.hpp"
#include "lang/methods.hpp"
#include "lang/operators.hpp"
#include "lang/script_error.hpp"
#include "sandbox/environment.hpp"

namespace evalbox::sandbox {
namespace {

using lang::CallArguments;
using lang::Interpreter;
using lang::Iterator;
using lang::ThrowError;
using lang::Value;
using lang::ValueKind;

constexpr double kInt64Limit = 9223372036854775808.0;

Value MakeIteratorValue(const std::string& type_name, Iterator next) {
    auto iterator = std::make_shared<lang::IteratorObject>();
    iterator->type_name = type_name;
    iterator->next = std::move(next);
    return Value::FromObject(ValueKind::kIterator, std::move(iterator));
}

std::string StripAscii(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\n\r\v\f");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\n\r\v\f");
    return text.substr(begin, end - begin + 1);
}

std::string Lowered(std::string text) {
    for (auto& ch : text) {
        if (ch >= 'A' && ch <= 'Z') {
            ch = static_cast<char>(ch + 32);
        }
    }
    return text;
}

int DigitValue(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'z') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'Z') return ch - 'A' + 10;
    return 99;
}

[[noreturn]] void InvalidIntLiteral(const std::string& text, int base) {
    ThrowError("ValueError",
               "invalid literal for int() with base " + std::to_string(base) + ": " + lang::Repr(Value::Str(text)));
}

std::int64_t ParseIntLiteral(const std::string& original, int base) {
    const std::string text = StripAscii(original);
    std::size_t i = 0;
    bool negative = false;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = text[i] == '-';
        ++i;
    }
    int effective = base;
    bool prefixed = false;
    if (i + 1 < text.size() && text[i] == '0') {
        const char marker = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i + 1])));
        const int prefix_base = marker == 'x' ? 16 : marker == 'o' ? 8 : marker == 'b' ? 2 : 0;
        if (prefix_base != 0 && (base == 0 || base == prefix_base)) {
            effective = prefix_base;
            prefixed = true;
            i += 2;
        }
    }
    if (effective == 0) {
        effective = 10;
    }
    const std::size_t digits_start = i;
    std::uint64_t magnitude = 0;
    bool overflow = false;
    bool previous_underscore = prefixed;
    bool any_digit = false;
    for (; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch == '_') {
            if (previous_underscore && !(prefixed && i == digits_start)) {
                InvalidIntLiteral(original, base);
            }
            if (!any_digit && !prefixed) {
                InvalidIntLiteral(original, base);
            }
            previous_underscore = true;
            continue;
        }
        const int digit = DigitValue(ch);
        if (digit >= effective) {
            InvalidIntLiteral(original, base);
        }
        previous_underscore = false;
        any_digit = true;
        if (magnitude > (std::numeric_limits<std::uint64_t>::max() - static_cast<std::uint64_t>(digit)) /
                            static_cast<std::uint64_t>(effective)) {
            overflow = true;
        } else {
            magnitude = magnitude * static_cast<std::uint64_t>(effective) + static_cast<std::uint64_t>(digit);
        }
    }
    if (!any_digit || previous_underscore) {
        InvalidIntLiteral(original, base);
    }
    if (base == 0 && !prefixed && text[digits_start] == '0' && magnitude != 0) {
        InvalidIntLiteral(original, base);
    }
    const std::uint64_t limit = negative ? static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1
                                         : static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
    if (overflow || magnitude > limit) {
        ThrowError("OverflowError", "integer overflow");
    }
    if (negative) {
        return magnitude == limit ? std::numeric_limits<std::int64_t>::min() : -static_cast<std::int64_t>(magnitude);
    }
    return static_cast<std::int64_t>(magnitude);
}

double ParseFloatLiteral(const std::string& original) {
    const auto fail = [&original]() {
        ThrowError("ValueError", "could not convert string to float: " + lang::Repr(Value::Str(original)));
    };
    std::string text = StripAscii(original);
    bool negative = false;
    std::size_t start = 0;
    if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
        negative = text[0] == '-';
        start = 1;
    }
    const std::string body = Lowered(text.substr(start));
    if (body == "inf" || body == "infinity") {
        return negative ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
    }
    if (body == "nan") {
        return std::numeric_limits<double>::quiet_NaN();
    }
    std::string cleaned;
    for (std::size_t i = 0; i < body.size(); ++i) {
        if (body[i] == '_') {
            const bool between_digits = i > 0 && i + 1 < body.size() && std::isdigit(static_cast<unsigned char>(body[i - 1])) &&
                                        std::isdigit(static_cast<unsigned char>(body[i + 1]));
            if (!between_digits) {
                fail();
            }
            continue;
        }
        cleaned.push_back(body[i]);
    }
    if (cleaned.empty() || !(std::isdigit(static_cast<unsigned char>(cleaned[0])) || cleaned[0] == '.')) {
        fail();
    }
    double value = 0.0;
    const auto result = std::from_chars(cleaned.data(), cleaned.data() + cleaned.size(), value);
    if (result.ec == std::errc::invalid_argument || result.ptr != cleaned.data() + cleaned.size()) {
        fail();
    }
    if (result.ec == std::errc::result_out_of_range) {
        value = std::strtod(cleaned.c_str(), nullptr);
    }
    return negative ? -value : value;
}

std::int64_t FloatToInt(double value) {
    if (std::isnan(value)) {
        ThrowError("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(value)) {
        ThrowError("OverflowError", "cannot convert float infinity to integer");
    }
    if (value >= kInt64Limit || value < -kInt64Limit) {
        ThrowError("OverflowError", "integer overflow");
    }
    return static_cast<std::int64_t>(value);
}

bool IsInstance(const Value& object, const Value& type) {
    if (type.kind() == ValueKind::kTuple) {
        for (const auto& candidate : type.AsTuple()->items) {
            if (IsInstance(object, candidate)) {
                return true;
            }
        }
        return false;
    }
    if (type.kind() == ValueKind::kExceptionType) {
        return object.kind() == ValueKind::kException &&
               object.AsException()->type->IsSubclassOf(*type.AsExceptionType());
    }
    if (type.kind() == ValueKind::kClass) {
        return object.kind() == ValueKind::kInstance &&
               object.AsInstance()->cls->IsSubclassOf(*type.AsClass());
    }
    if (type.kind() == ValueKind::kBuiltin && !type.AsBuiltin()->constructs.empty()) {
        const auto& name = type.AsBuiltin()->constructs;
        if (name == "int") return object.IsIntegral();
        if (name == "bool") return object.IsBool();
        if (name == "float") return object.IsFloat();
        if (name == "str") return object.IsStr();
        if (name == "list") return object.kind() == ValueKind::kList;
        if (name == "tuple") return object.kind() == ValueKind::kTuple;
        if (name == "dict") return object.kind() == ValueKind::kDict;
        if (name == "set") return object.kind() == ValueKind::kSet;
        if (name == "frozenset") return object.kind() == ValueKind::kFrozenSet;
        if (name == "slice") return object.kind() == ValueKind::kSlice;
        if (name == "range") return object.kind() == ValueKind::kRange;
        return false;
    }
    ThrowError("TypeError", "isinstance() arg 2 must be a type, a tuple of types, or a union");
}

// CPython's integer hash: the value reduced modulo 2**61 - 1 with its sign
// kept, where -1 is reserved and becomes -2.
std::int64_t IntegerHash(std::int64_t value) {
    constexpr std::uint64_t kModulus = (std::uint64_t{1} << 61) - 1;
    const std::uint64_t magnitude = value < 0 ? 0 - static_cast<std::uint64_t>(value) : static_cast<std::uint64_t>(value);
    auto hashed = static_cast<std::int64_t>(magnitude % kModulus);
    if (value < 0) {
        hashed = -hashed;
    }
    return hashed == -1 ? -2 : hashed;
}

bool IsStopIteration(const lang::ScriptException& error) {
    static const auto kStopIteration = lang::FindExceptionType("StopIteration");
    const Value& exception = error.exception();
    return exception.kind() == ValueKind::kException &&
           exception.AsException()->type->IsSubclassOf(*kStopIteration);
}

std::int64_t Length(Interpreter& interpreter, const Value& value) {
    switch (value.kind()) {
        case ValueKind::kStr: return static_cast<std::int64_t>(lang::CodePointLength(value.AsStr()));
        case ValueKind::kList: return static_cast<std::int64_t>(value.AsList()->items.size());
        case ValueKind::kTuple: return static_cast<std::int64_t>(value.AsTuple()->items.size());
        case ValueKind::kDict: return static_cast<std::int64_t>(value.AsDict()->size());
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return static_cast<std::int64_t>(value.AsSet()->size());
        case ValueKind::kRange: return value.AsRange()->Length();
        case ValueKind::kInstance: {
            const auto result = interpreter.CallSpecial(value, "__len__", {});
            if (!result) {
                break;
            }
            if (!result->IsIntegral()) {
                ThrowError("TypeError", "'" + lang::TypeName(*result) + "' object cannot be interpreted as an integer");
            }
            if (result->AsInt() < 0) {
                ThrowError("ValueError", "__len__() should return >= 0");
            }
            return result->AsInt();
        }
        case ValueKind::kIterator:
            if (value.AsIterator()->is_view) {
                return static_cast<std::int64_t>(value.AsIterator()->snapshot.size());
            }
            break;
        default:
            break;
    }
    ThrowError("TypeError", "object of type '" + lang::TypeName(value) + "' has no len()");
}

// max() and min() share argument handling; pick_max selects the comparison.
Value Extreme(Interpreter& interpreter, CallArguments& args, const std::string& name, bool pick_max) {
    lang::CheckKeywords(name, args, {"key", "default"});
    const Value* key = args.Keyword("key");
    const Value* fallback = args.Keyword("default");
    std::vector<Value> items;
    if (args.positional.empty()) {
        ThrowError("TypeError", name + " expected at least 1 argument, got 0");
    }
    if (args.positional.size() == 1) {
        items = interpreter.Materialize(args.positional[0]);
    } else {
        if (fallback != nullptr) {
            ThrowError("TypeError", "Cannot specify a default for " + name + "() with multiple positional arguments");
        }
        items = args.positional;
    }
    if (items.empty()) {
        if (fallback != nullptr) {
            return *fallback;
        }
        ThrowError("ValueError", name + "() arg is an empty sequence");
    }
    const bool keyed = key != nullptr && !key->IsNone();
    std::size_t best = 0;
    Value best_key = keyed ? interpreter.Call(*key, std::vector<Value>{items[0]}) : items[0];
    for (std::size_t i = 1; i < items.size(); ++i) {
        interpreter.Tick();
        Value candidate = keyed ? interpreter.Call(*key, std::vector<Value>{items[i]}) : items[i];
        const bool better = pick_max ? lang::LessThan(best_key, candidate) : lang::LessThan(candidate, best_key);
        if (better) {
            best = i;
            best_key = std::move(candidate);
        }
    }
    return items[best];
}

Value RoundFloat(double value, const Value* digits) {
    if (digits == nullptr || digits->IsNone()) {
        return Value::Int(FloatToInt(std::nearbyint(value)));
    }
    const auto places = lang::RequireInt(*digits);
    if (!std::isfinite(value)) {
        return Value::Float(value);
    }
    if (places >= 0) {
        if (places > 300) {
            return Value::Float(value);
        }
        char buffer[512];
        std::snprintf(buffer, sizeof(buffer), "%.*f", static_cast<int>(std::min<std::int64_t>(places, 300)), value);
        return Value::Float(std::strtod(buffer, nullptr));
    }
    if (places < -308) {
        return Value::Float(std::copysign(0.0, value));
    }
    const double scale = std::pow(10.0, static_cast<double>(-places));
    return Value::Float(std::nearbyint(value / scale) * scale);
}

Value RoundInt(std::int64_t value, std::int64_t places) {
    if (places >= 0) {
        return Value::Int(value);
    }
    if (places < -18) {
        return Value::Int(0);
    }
    std::int64_t scale = 1;
    for (std::int64_t i = 0; i < -places; ++i) {
        scale *= 10;
    }
    const std::int64_t quotient = lang::FloorDivide(value, scale);
    const std::int64_t remainder = value - quotient * scale;
    std::int64_t rounded = quotient;
    if (remainder * 2 > scale || (remainder * 2 == scale && (quotient & 1) != 0)) {
        rounded = quotient + 1;
    }
    return Value::Int(lang::CheckedMultiply(rounded, scale));
}

std::int64_t ModularPower(std::int64_t base, std::int64_t exponent, std::int64_t modulus) {
    if (modulus == 0) {
        ThrowError("ValueError", "pow() 3rd argument cannot be 0");
    }
    if (exponent < 0) {
        ThrowError("ValueError", "base is not invertible for the given modulus");
    }
    const __int128 mod = modulus;
    __int128 result = 1 % mod;
    __int128 factor = base % mod;
    while (exponent > 0) {
        if (exponent & 1) {
            result = (result * factor) % mod;
        }
        factor = (factor * factor) % mod;
        exponent >>= 1;
    }
    if (result != 0 && ((result < 0) != (mod < 0))) {
        result += mod;
    }
    return static_cast<std::int64_t>(result);
}

Value Reversed(Interpreter& interpreter, const Value& sequence) {
    switch (sequence.kind()) {
        case ValueKind::kList: {
            auto list = sequence.AsList();
            return MakeIteratorValue("list_reverseiterator",
                                     [list, position = list->items.size()]() mutable -> std::optional<Value> {
                                         if (position == 0 || position > list->items.size()) {
                                             position = 0;
                                             return std::nullopt;
                                         }
                                         return list->items[--position];
                                     });
        }
        case ValueKind::kRange: {
            auto range = sequence.AsRange();
            return MakeIteratorValue("range_iterator",
                                     [range, position = range->Count()]() mutable -> std::optional<Value> {
                                         if (position == 0) {
                                             return std::nullopt;
                                         }
                                         return Value::Int(range->At(--position));
                                     });
        }
        case ValueKind::kTuple:
        case ValueKind::kStr:
        case ValueKind::kDict: {
            auto items = std::make_shared<std::vector<Value>>(interpreter.Materialize(sequence));
            const std::string type_name = sequence.kind() == ValueKind::kDict ? "dict_reversekeyiterator"
                                                                                : "reversed";
            return MakeIteratorValue(type_name, [items, position = items->size()]() mutable -> std::optional<Value> {
                if (position == 0) {
                    return std::nullopt;
                }
                return (*items)[--position];
            });
        }
        default:
            ThrowError("TypeError", "'" + lang::TypeName(sequence) + "' object is not reversible");
    }
}

Value Sum(Interpreter& interpreter, CallArguments& args) {
    lang::CheckKeywords("sum", args, {"start"});
    if (args.positional.empty() || args.positional.size() > 2) {
        ThrowError("TypeError", "sum() takes at least 1 positional argument (" +
                                    std::to_string(args.positional.size()) + " given)");
    }
    const Value* start = lang::Argument(args, 1, "start");
    Value total = start != nullptr ? *start : Value::Int(0);
    if (total.IsStr()) {
        ThrowError("TypeError", "sum() can't sum strings [use ''.join(seq) instead]");
    }
    auto next = interpreter.MakeIterator(args.positional[0]);
    while (auto item = next()) {
        interpreter.Tick();
        total = lang::BinaryOperation(interpreter, lang::BinaryOperator::kAdd, total, *item);
    }
    return total;
}

Value DictConstructor(Interpreter& interpreter, CallArguments& args) {
    if (args.positional.size() > 1) {
        ThrowError("TypeError", "dict expected at most 1 argument, got " + std::to_string(args.positional.size()));
    }
    Value result = Value::Dict();
    lang::CallMethod(interpreter, result, "update", args);
    return result;
}

}  // namespace

Value MakeBuiltin(const std::string& name, lang::BuiltinCallable fn, const std::string& constructs) {
    auto builtin = std::make_shared<lang::BuiltinFunction>();
    builtin->name = name;
    builtin->fn = std::move(fn);
    builtin->constructs = constructs;
    return Value::FromObject(ValueKind::kBuiltin, std::move(builtin));
}

const std::vector<std::string>& ConstructorNames() {
    static const std::vector<std::string> kNames = {"bool", "int",   "float", "str",       "list",
                                                    "dict", "set",   "tuple", "frozenset", "range",
                                                    "slice"};
    return kNames;
}

const std::vector<std::string>& FunctionNames() {
    static const std::vector<std::string> kNames = {
        "abs", "all",  "any", "bin", "chr",  "divmod", "enumerate", "filter", "format", "hash",
        "hex", "isinstance", "iter", "len", "map", "max", "min", "next", "oct", "ord",
        "pow", "repr", "reversed", "round", "sorted", "sum", "zip"};
    return kNames;
}

const std::vector<std::string>& ExceptionTypeNames() {
    static const std::vector<std::string> kNames = {
        "Exception",     "ArithmeticError",  "LookupError",      "ValueError",     "TypeError",
        "IndexError",    "KeyError",         "ZeroDivisionError", "OverflowError", "StopIteration",
        "RuntimeError",  "NameError",        "UnboundLocalError", "AttributeError", "RecursionError",
        "NotImplementedError", "AssertionError", "MemoryError",  "ImportError"};
    return kNames;
}

void RegisterConstructors(BuiltinTable& table) {
    table["bool"] = MakeBuiltin("bool", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("bool", args, 0, 1);
        return Value::Bool(!args.positional.empty() && lang::Truthy(args.positional[0]));
    }, "bool");

    table["int"] = MakeBuiltin("int", [](Interpreter&, CallArguments& args) {
        lang::CheckKeywords("int", args, {"base"});
        if (args.positional.size() > 2) {
            ThrowError("TypeError", "int() takes at most 2 arguments (" + std::to_string(args.positional.size()) +
                                        " given)");
        }
        const Value* value = lang::Argument(args, 0, "x");
        const Value* base = lang::Argument(args, 1, "base");
        if (value == nullptr) {
            if (base != nullptr) {
                ThrowError("TypeError", "int() missing string argument");
            }
            return Value::Int(0);
        }
        if (base != nullptr) {
            if (!value->IsStr()) {
                ThrowError("TypeError", "int() can't convert non-string with explicit base");
            }
            const auto radix = lang::RequireInt(*base);
            if (radix != 0 && (radix < 2 || radix > 36)) {
                ThrowError("ValueError", "int() base must be >= 2 and <= 36, or 0");
            }
            return Value::Int(ParseIntLiteral(value->AsStr(), static_cast<int>(radix)));
        }
        if (value->IsIntegral()) {
            return Value::Int(value->AsInt());
        }
        if (value->IsFloat()) {
            return Value::Int(FloatToInt(std::trunc(value->AsDouble())));
        }
        if (value->IsStr()) {
            return Value::Int(ParseIntLiteral(value->AsStr(), 10));
        }
        ThrowError("TypeError", "int() argument must be a string, a bytes-like object or a real number, not '" +
                                    lang::TypeName(*value) + "'");
    }, "int");

    table["float"] = MakeBuiltin("float", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("float", args, 0, 1);
        if (args.positional.empty()) {
            return Value::Float(0.0);
        }
        const Value& value = args.positional[0];
        if (value.IsNumber()) {
            return Value::Float(value.AsDouble());
        }
        if (value.IsStr()) {
            return Value::Float(ParseFloatLiteral(value.AsStr()));
        }
        ThrowError("TypeError", "float() argument must be a string or a real number, not '" +
                                    lang::TypeName(value) + "'");
    }, "float");

    table["str"] = MakeBuiltin("str", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("str", args, 0, 1);
        return Value::Str(args.positional.empty() ? std::string() : lang::Str(args.positional[0]));
    }, "str");

    table["list"] = MakeBuiltin("list", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("list", args, 0, 1);
        return Value::List(args.positional.empty() ? std::vector<Value>() : interpreter.Materialize(args.positional[0]));
    }, "list");

    table["tuple"] = MakeBuiltin("tuple", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("tuple", args, 0, 1);
        if (!args.positional.empty() && args.positional[0].kind() == ValueKind::kTuple) {
            return args.positional[0];
        }
        return Value::Tuple(args.positional.empty() ? std::vector<Value>()
                                                    : interpreter.Materialize(args.positional[0]));
    }, "tuple");

    table["set"] = MakeBuiltin("set", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("set", args, 0, 1);
        Value result = Value::Set();
        if (!args.positional.empty()) {
            auto next = interpreter.MakeIterator(args.positional[0]);
            while (auto item = next()) {
                interpreter.Tick();
                result.AsSet()->Add(*item);
                interpreter.CheckContainerSize(result.AsSet()->size());
            }
        }
        return result;
    }, "set");

    table["frozenset"] = MakeBuiltin("frozenset", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("frozenset", args, 0, 1);
        if (!args.positional.empty() && args.positional[0].kind() == ValueKind::kFrozenSet) {
            return args.positional[0];
        }
        Value result = Value::FrozenSet();
        if (!args.positional.empty()) {
            auto next = interpreter.MakeIterator(args.positional[0]);
            while (auto item = next()) {
                interpreter.Tick();
                result.AsSet()->Add(*item);
                interpreter.CheckContainerSize(result.AsSet()->size());
            }
        }
        return result;
    }, "frozenset");

    table["dict"] = MakeBuiltin("dict", DictConstructor, "dict");

    // slice(stop) or slice(start, stop[, step]); bounds are checked when the slice is applied.
    table["slice"] = MakeBuiltin("slice", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("slice", args, 1, 3);
        if (args.positional.size() == 1) {
            return Value::Slice(Value::None(), args.positional[0], Value::None());
        }
        return Value::Slice(args.positional[0], args.positional[1],
                            args.positional.size() == 3 ? args.positional[2] : Value::None());
    }, "slice");

    table["range"] = MakeBuiltin("range", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("range", args, 1, 3);
        std::int64_t start = 0;
        std::int64_t stop = 0;
        std::int64_t step = 1;
        if (args.positional.size() == 1) {
            stop = lang::RequireInt(args.positional[0]);
        } else {
            start = lang::RequireInt(args.positional[0]);
            stop = lang::RequireInt(args.positional[1]);
            if (args.positional.size() == 3) {
                step = lang::RequireInt(args.positional[2]);
            }
        }
        if (step == 0) {
            ThrowError("ValueError", "range() arg 3 must not be zero");
        }
        return Value::Range(start, stop, step);
    }, "range");
}

void RegisterFunctions(BuiltinTable& table) {
    table["abs"] = MakeBuiltin("abs", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("abs", args, 1, 1);
        const Value& value = args.positional[0];
        if (value.IsFloat()) {
            return Value::Float(std::fabs(value.AsDouble()));
        }
        if (value.IsIntegral()) {
            const auto number = value.AsInt();
            if (number == std::numeric_limits<std::int64_t>::min()) {
                ThrowError("OverflowError", "integer overflow");
            }
            return Value::Int(number < 0 ? -number : number);
        }
        ThrowError("TypeError", "bad operand type for abs(): '" + lang::TypeName(value) + "'");
    });

    table["all"] = MakeBuiltin("all", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("all", args, 1, 1);
        auto next = interpreter.MakeIterator(args.positional[0]);
        while (auto item = next()) {
            interpreter.Tick();
            if (!lang::Truthy(*item)) {
                return Value::Bool(false);
            }
        }
        return Value::Bool(true);
    });

    table["any"] = MakeBuiltin("any", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("any", args, 1, 1);
        auto next = interpreter.MakeIterator(args.positional[0]);
        while (auto item = next()) {
            interpreter.Tick();
            if (lang::Truthy(*item)) {
                return Value::Bool(true);
            }
        }
        return Value::Bool(false);
    });

    for (const auto& [name, spec] : std::vector<std::pair<std::string, std::string>>{
             {"bin", "#b"}, {"oct", "#o"}, {"hex", "#x"}}) {
        table[name] = MakeBuiltin(name, [name = name, spec = spec](Interpreter&, CallArguments& args) {
            lang::CheckArity(name, args, 1, 1);
            if (!args.positional[0].IsIntegral()) {
                ThrowError("TypeError", "'" + lang::TypeName(args.positional[0]) +
                                            "' object cannot be interpreted as an integer");
            }
            return Value::Str(lang::FormatValue(Value::Int(args.positional[0].AsInt()), spec));
        });
    }

    table["chr"] = MakeBuiltin("chr", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("chr", args, 1, 1);
        const auto code = lang::RequireInt(args.positional[0]);
        if (code < 0 || code > 0x10FFFF) {
            ThrowError("ValueError", "chr() arg not in range(0x110000)");
        }
        return Value::Str(lang::EncodeUtf8(static_cast<char32_t>(code)));
    });

    table["ord"] = MakeBuiltin("ord", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("ord", args, 1, 1);
        const Value& value = args.positional[0];
        if (!value.IsStr()) {
            ThrowError("TypeError", "ord() expected string of length 1, but " + lang::TypeName(value) + " found");
        }
        const auto chars = lang::DecodeUtf8(value.AsStr());
        if (chars.size() != 1) {
            ThrowError("TypeError", "ord() expected a character, but string of length " +
                                        std::to_string(chars.size()) + " found");
        }
        return Value::Int(static_cast<std::int64_t>(chars[0]));
    });

    table["divmod"] = MakeBuiltin("divmod", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("divmod", args, 2, 2);
        const Value& lhs = args.positional[0];
        const Value& rhs = args.positional[1];
        if (lhs.IsIntegral() && rhs.IsIntegral()) {
            if (rhs.AsInt() == 0) {
                ThrowError("ZeroDivisionError", "integer division or modulo by zero");
            }
            return Value::Tuple({Value::Int(lang::FloorDivide(lhs.AsInt(), rhs.AsInt())),
                                 Value::Int(lang::FloorModulo(lhs.AsInt(), rhs.AsInt()))});
        }
        if (lhs.IsNumber() && rhs.IsNumber() && rhs.AsDouble() == 0.0) {
            ThrowError("ZeroDivisionError", "float divmod()");
        }
        return Value::Tuple({lang::BinaryOperation(interpreter, lang::BinaryOperator::kFloorDiv, lhs, rhs),
                             lang::BinaryOperation(interpreter, lang::BinaryOperator::kMod, lhs, rhs)});
    });

    table["enumerate"] = MakeBuiltin("enumerate", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckKeywords("enumerate", args, {"iterable", "start"});
        const Value* iterable = lang::Argument(args, 0, "iterable");
        const Value* start = lang::Argument(args, 1, "start");
        if (iterable == nullptr) {
            ThrowError("TypeError", "enumerate() missing required argument 'iterable'");
        }
        auto source = interpreter.MakeIterator(*iterable);
        std::int64_t counter = start != nullptr ? lang::RequireInt(*start) : 0;
        return MakeIteratorValue("enumerate", [source = std::move(source), counter,
                                               started = false]() mutable -> std::optional<Value> {
            auto item = source();
            if (!item) {
                return std::nullopt;
            }
            // Advance only once another item exists, so start=maxint still yields once.
            if (started) {
                counter = lang::CheckedAdd(counter, 1);
            }
            started = true;
            return Value::Tuple({Value::Int(counter), std::move(*item)});
        });
    });

    table["filter"] = MakeBuiltin("filter", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("filter", args, 2, 2);
        const Value predicate = args.positional[0];
        auto source = interpreter.MakeIterator(args.positional[1]);
        Interpreter* owner = &interpreter;
        return MakeIteratorValue("filter", [owner, predicate, source = std::move(source)]() mutable
                                               -> std::optional<Value> {
            while (auto item = source()) {
                owner->Tick();
                const bool keep = predicate.IsNone()
                    ? lang::Truthy(*item)
                    : lang::Truthy(owner->Call(predicate, std::vector<Value>{*item}));
                if (keep) {
                    return item;
                }
            }
            return std::nullopt;
        });
    });

    table["map"] = MakeBuiltin("map", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckKeywords("map", args, {});
        if (args.positional.size() < 2) {
            ThrowError("TypeError", "map() must have at least two arguments.");
        }
        const Value function = args.positional[0];
        std::vector<Iterator> sources;
        for (std::size_t i = 1; i < args.positional.size(); ++i) {
            sources.push_back(interpreter.MakeIterator(args.positional[i]));
        }
        Interpreter* owner = &interpreter;
        return MakeIteratorValue("map", [owner, function, sources = std::move(sources), done = false]() mutable
                                            -> std::optional<Value> {
            if (done) {
                return std::nullopt;
            }
            std::vector<Value> call_args;
            for (auto& source : sources) {
                auto item = source();
                if (!item) {
                    done = true;
                    return std::nullopt;
                }
                call_args.push_back(std::move(*item));
            }
            return owner->Call(function, std::move(call_args));
        });
    });

    table["zip"] = MakeBuiltin("zip", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckKeywords("zip", args, {});
        std::vector<Iterator> sources;
        for (const auto& iterable : args.positional) {
            sources.push_back(interpreter.MakeIterator(iterable));
        }
        return MakeIteratorValue("zip", [sources = std::move(sources), done = false]() mutable
                                            -> std::optional<Value> {
            if (done || sources.empty()) {
                return std::nullopt;
            }
            std::vector<Value> row;
            for (auto& source : sources) {
                auto item = source();
                if (!item) {
                    done = true;
                    return std::nullopt;
                }
                row.push_back(std::move(*item));
            }
            return Value::Tuple(std::move(row));
        });
    });

    table["format"] = MakeBuiltin("format", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("format", args, 1, 2);
        const std::string spec = args.positional.size() > 1
            ? lang::RequireStr(args.positional[1], "format() argument 2 must be str")
            : std::string();
        return Value::Str(lang::FormatValue(args.positional[0], spec));
    });

    table["hash"] = MakeBuiltin("hash", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("hash", args, 1, 1);
        const Value& value = args.positional[0];
        if (value.IsIntegral()) {
            return Value::Int(IntegerHash(value.AsInt()));
        }
        if (value.IsFloat()) {
            const double number = value.AsDouble();
            if (std::trunc(number) == number && number >= -9223372036854775808.0 &&
                number < 9223372036854775808.0) {
                return Value::Int(IntegerHash(static_cast<std::int64_t>(number)));
            }
        }
        const auto hashed = static_cast<std::int64_t>(lang::Hash(value));
        return Value::Int(hashed == -1 ? -2 : hashed);
    });

    table["isinstance"] = MakeBuiltin("isinstance", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("isinstance", args, 2, 2);
        return Value::Bool(IsInstance(args.positional[0], args.positional[1]));
    });

    table["iter"] = MakeBuiltin("iter", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("iter", args, 1, 1);
        const Value& value = args.positional[0];
        if (value.kind() == ValueKind::kIterator && !value.AsIterator()->is_view) {
            return value;
        }
        if (value.kind() == ValueKind::kInstance) {
            auto result = interpreter.CallSpecial(value, "__iter__", {});
            if (!result) {
                ThrowError("TypeError", "'" + lang::TypeName(value) + "' object is not iterable");
            }
            const bool iterator = (result->kind() == ValueKind::kIterator && !result->AsIterator()->is_view) ||
                                  (result->kind() == ValueKind::kInstance &&
                                   result->AsInstance()->cls->Lookup("__next__") != nullptr);
            if (!iterator) {
                ThrowError("TypeError", "iter() returned non-iterator of type '" + lang::TypeName(*result) + "'");
            }
            return *result;
        }
        return MakeIteratorValue(lang::TypeName(value) + "_iterator", interpreter.MakeIterator(value));
    });

    table["next"] = MakeBuiltin("next", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("next", args, 1, 2);
        const Value& value = args.positional[0];
        if (value.kind() == ValueKind::kInstance && value.AsInstance()->cls->Lookup("__next__") != nullptr) {
            try {
                return *interpreter.CallSpecial(value, "__next__", {});
            } catch (const lang::ScriptException& error) {
                if (args.positional.size() < 2 || !IsStopIteration(error)) {
                    throw;
                }
                return args.positional[1];
            }
        }
        if (value.kind() != ValueKind::kIterator || value.AsIterator()->is_view) {
            ThrowError("TypeError", "'" + lang::TypeName(value) + "' object is not an iterator");
        }
        auto item = value.AsIterator()->next();
        if (item) {
            return *item;
        }
        if (args.positional.size() > 1) {
            return args.positional[1];
        }
        ThrowError("StopIteration", "");
    });

    table["len"] = MakeBuiltin("len", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("len", args, 1, 1);
        return Value::Int(Length(interpreter, args.positional[0]));
    });

    table["max"] = MakeBuiltin("max", [](Interpreter& interpreter, CallArguments& args) {
        return Extreme(interpreter, args, "max", true);
    });

    table["min"] = MakeBuiltin("min", [](Interpreter& interpreter, CallArguments& args) {
        return Extreme(interpreter, args, "min", false);
    });

    table["pow"] = MakeBuiltin("pow", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckKeywords("pow", args, {"base", "exp", "mod"});
        const Value* base = lang::Argument(args, 0, "base");
        const Value* exponent = lang::Argument(args, 1, "exp");
        const Value* modulus = lang::Argument(args, 2, "mod");
        if (base == nullptr || exponent == nullptr) {
            ThrowError("TypeError", "pow() missing required argument 'exp' (pos 2)");
        }
        if (modulus == nullptr || modulus->IsNone()) {
            return lang::BinaryOperation(interpreter, lang::BinaryOperator::kPow, *base, *exponent);
        }
        if (!base->IsIntegral() || !exponent->IsIntegral() || !modulus->IsIntegral()) {
            ThrowError("TypeError", "pow() 3rd argument not allowed unless all arguments are integers");
        }
        return Value::Int(ModularPower(base->AsInt(), exponent->AsInt(), modulus->AsInt()));
    });

    table["repr"] = MakeBuiltin("repr", [](Interpreter&, CallArguments& args) {
        lang::CheckArity("repr", args, 1, 1);
        return Value::Str(lang::Repr(args.positional[0]));
    });

    table["reversed"] = MakeBuiltin("reversed", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckArity("reversed", args, 1, 1);
        return Reversed(interpreter, args.positional[0]);
    });

    table["round"] = MakeBuiltin("round", [](Interpreter&, CallArguments& args) {
        lang::CheckKeywords("round", args, {"number", "ndigits"});
        const Value* number = lang::Argument(args, 0, "number");
        const Value* digits = lang::Argument(args, 1, "ndigits");
        if (number == nullptr) {
            ThrowError("TypeError", "round() missing required argument 'number' (pos 1)");
        }
        if (number->IsFloat()) {
            return RoundFloat(number->AsDouble(), digits);
        }
        if (number->IsIntegral()) {
            const std::int64_t places = digits == nullptr || digits->IsNone() ? 0 : lang::RequireInt(*digits);
            return RoundInt(number->AsInt(), places);
        }
        ThrowError("TypeError", "type " + lang::TypeName(*number) + " doesn't define __round__ method");
    });

    table["sorted"] = MakeBuiltin("sorted", [](Interpreter& interpreter, CallArguments& args) {
        lang::CheckKeywords("sorted", args, {"key", "reverse"});
        if (args.positional.size() != 1) {
            ThrowError("TypeError", "sorted expected 1 argument, got " + std::to_string(args.positional.size()));
        }
        auto items = interpreter.Materialize(args.positional[0]);
        const Value* reverse = args.Keyword("reverse");
        lang::SortValues(interpreter, items, args.Keyword("key"), reverse != nullptr && lang::Truthy(*reverse));
        return Value::List(std::move(items));
    });

    table["sum"] = MakeBuiltin("sum", Sum);
}

void RegisterExceptionTypes(BuiltinTable& table) {
    for (const auto& name : ExceptionTypeNames()) {
        table[name] = Value::FromExceptionType(lang::FindExceptionType(name));
    }
}

void RegisterPrint(BuiltinTable& table, std::shared_ptr<OutputSink> sink) {
    table["print"] = MakeBuiltin("print", [sink](Interpreter&, CallArguments& args) {
        lang::CheckKeywords("print", args, {"sep", "end", "flush"});
        auto text_option = [&args](const std::string& name, const std::string& fallback) {
            const Value* value = args.Keyword(name);
            if (value == nullptr || value->IsNone()) {
                return fallback;
            }
            if (!value->IsStr()) {
                ThrowError("TypeError", name + " must be None or a string, not " + lang::TypeName(*value));
            }
            return value->AsStr();
        };
        const std::string separator = text_option("sep", " ");
        const std::string end = text_option("end", "\n");
        std::string line;
        for (std::size_t i = 0; i < args.positional.size(); ++i) {
            if (i > 0) {
                line += separator;
            }
            line += lang::Str(args.positional[i]);
        }
        line += end;
        sink->Write(line);
        return Value::None();
    });
}

}  // namespace evalbox::sandbox
