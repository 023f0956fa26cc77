#include "lang/value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <new>
#include <sstream>

#include "lang/ast.hpp"
#include "lang/script_error.hpp"

namespace evalbox::lang {
namespace {

constexpr int kMaxCompareDepth = 200;
// repr, hashing and deep copies walk nested values on the native stack.
constexpr int kMaxNestingDepth = 500;

thread_local ExecutionHooks* current_hooks = nullptr;

std::optional<Value> CallSpecial(const Value& self, const std::string& name, std::vector<Value> args = {}) {
    if (self.kind() != ValueKind::kInstance || current_hooks == nullptr) {
        return std::nullopt;
    }
    return current_hooks->CallSpecial(self, name, std::move(args));
}

bool DefinesSpecial(const Value& value, const std::string& name) {
    return value.kind() == ValueKind::kInstance && value.AsInstance()->cls->Lookup(name) != nullptr;
}

void TrackObject(const std::shared_ptr<Object>& object) {
    if (current_hooks != nullptr) {
        current_hooks->Track(object);
    }
}

thread_local bool release_queue_retired = false;

struct ReleaseQueue {
    std::vector<std::shared_ptr<Object>> pending;
    bool draining = false;

    ~ReleaseQueue() { release_queue_retired = true; }
};

ReleaseQueue& Releases() {
    thread_local ReleaseQueue queue;
    return queue;
}

// Defers the release of value's object to the outermost Drain().
void Park(Value& value) {
    auto object = value.DetachObject();
    if (!object || object.use_count() > 1 || release_queue_retired) {
        return;
    }
    try {
        Releases().pending.push_back(std::move(object));
    } catch (const std::bad_alloc&) {
        object.reset();
    }
}

void Drain() {
    if (release_queue_retired) {
        return;
    }
    auto& queue = Releases();
    if (queue.draining) {
        return;
    }
    queue.draining = true;
    while (!queue.pending.empty()) {
        auto object = std::move(queue.pending.back());
        queue.pending.pop_back();
        object.reset();
    }
    queue.draining = false;
}

template <typename Map>
void ParkAttributes(Map& attributes) {
    for (auto& entry : attributes) {
        Park(entry.second);
    }
}

template <typename T>
std::shared_ptr<T> Cast(const std::variant<std::monostate, bool, std::int64_t, double, std::string,
                                           std::shared_ptr<Object>>& data) {
    return std::static_pointer_cast<T>(std::get<std::shared_ptr<Object>>(data));
}

void AppendStrRepr(std::string& out, const std::string& text) {
    const bool has_single = text.find('\'') != std::string::npos;
    const bool has_double = text.find('"') != std::string::npos;
    const char quote = (has_single && !has_double) ? '"' : '\'';
    out.push_back(quote);
    for (const char ch : text) {
        const auto byte = static_cast<unsigned char>(ch);
        switch (ch) {
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (ch == quote) {
                    out.push_back('\\');
                    out.push_back(ch);
                } else if (byte < 0x20 || byte == 0x7f) {
                    static const char* kHex = "0123456789abcdef";
                    out += "\\x";
                    out.push_back(kHex[byte >> 4]);
                    out.push_back(kHex[byte & 0xF]);
                } else {
                    out.push_back(ch);
                }
        }
    }
    out.push_back(quote);
}

void AppendRepr(std::string& out, const Value& value, std::vector<const Object*>& active, int depth);

void AppendSequence(std::string& out,
                    const std::vector<Value>& items,
                    std::vector<const Object*>& active,
                    int depth) {
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        AppendRepr(out, items[i], active, depth + 1);
    }
}

void AppendRepr(std::string& out, const Value& value, std::vector<const Object*>& active, int depth) {
    if (depth > kMaxNestingDepth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded while getting the repr of an object");
    }
    const Object* identity = value.Identity();
    const bool container = value.kind() == ValueKind::kList || value.kind() == ValueKind::kDict ||
                           value.kind() == ValueKind::kSet;
    if (container && std::find(active.begin(), active.end(), identity) != active.end()) {
        out += value.kind() == ValueKind::kList ? "[...]" : "{...}";
        return;
    }
    switch (value.kind()) {
        case ValueKind::kNone:
            out += "None";
            return;
        case ValueKind::kBool:
            out += value.AsBool() ? "True" : "False";
            return;
        case ValueKind::kInt:
            out += std::to_string(value.AsInt());
            return;
        case ValueKind::kFloat:
            out += FormatFloat(value.AsDouble());
            return;
        case ValueKind::kStr:
            AppendStrRepr(out, value.AsStr());
            return;
        case ValueKind::kList: {
            active.push_back(identity);
            out.push_back('[');
            AppendSequence(out, value.AsList()->items, active, depth);
            out.push_back(']');
            active.pop_back();
            return;
        }
        case ValueKind::kTuple: {
            const auto& items = value.AsTuple()->items;
            out.push_back('(');
            AppendSequence(out, items, active, depth);
            if (items.size() == 1) {
                out.push_back(',');
            }
            out.push_back(')');
            return;
        }
        case ValueKind::kDict: {
            active.push_back(identity);
            out.push_back('{');
            const auto& entries = value.AsDict()->entries;
            for (std::size_t i = 0; i < entries.size(); ++i) {
                if (i > 0) {
                    out += ", ";
                }
                AppendRepr(out, entries[i].first, active, depth + 1);
                out += ": ";
                AppendRepr(out, entries[i].second, active, depth + 1);
            }
            out.push_back('}');
            active.pop_back();
            return;
        }
        case ValueKind::kSet: {
            const auto& items = value.AsSet()->items;
            if (items.empty()) {
                out += "set()";
                return;
            }
            active.push_back(identity);
            out.push_back('{');
            AppendSequence(out, items, active, depth);
            out.push_back('}');
            active.pop_back();
            return;
        }
        case ValueKind::kFrozenSet: {
            const auto& items = value.AsSet()->items;
            out += "frozenset(";
            if (!items.empty()) {
                out.push_back('{');
                AppendSequence(out, items, active, depth);
                out.push_back('}');
            }
            out.push_back(')');
            return;
        }
        case ValueKind::kSlice: {
            const auto slice = value.AsSlice();
            out += "slice(";
            AppendRepr(out, slice->start, active, depth + 1);
            out += ", ";
            AppendRepr(out, slice->stop, active, depth + 1);
            out += ", ";
            AppendRepr(out, slice->step, active, depth + 1);
            out.push_back(')');
            return;
        }
        case ValueKind::kClass:
            out += "<class '" + value.AsClass()->name + "'>";
            return;
        case ValueKind::kInstance: {
            if (auto text = CallSpecial(value, "__repr__")) {
                if (!text->IsStr()) {
                    ThrowError("TypeError", "__repr__ returned non-string (type " + TypeName(*text) + ")");
                }
                out += text->AsStr();
            } else {
                out += "<" + value.AsInstance()->cls->name + " object>";
            }
            return;
        }
        case ValueKind::kRange: {
            const auto range = value.AsRange();
            out += "range(" + std::to_string(range->start) + ", " + std::to_string(range->stop);
            if (range->step != 1) {
                out += ", " + std::to_string(range->step);
            }
            out.push_back(')');
            return;
        }
        case ValueKind::kIterator: {
            const auto iterator = value.AsIterator();
            if (iterator->is_view) {
                out += iterator->type_name + "([";
                AppendSequence(out, iterator->snapshot, active, depth);
                out += "])";
            } else {
                out += "<" + iterator->type_name + " object>";
            }
            return;
        }
        case ValueKind::kFunction:
            out += "<function " + value.AsFunction()->def->name + ">";
            return;
        case ValueKind::kBuiltin: {
            const auto builtin = value.AsBuiltin();
            if (!builtin->constructs.empty()) {
                out += "<class '" + builtin->constructs + "'>";
            } else {
                out += "<built-in function " + builtin->name + ">";
            }
            return;
        }
        case ValueKind::kBoundMethod: {
            const auto method = value.AsBoundMethod();
            if (!method->function.IsNone()) {
                out += "<bound method " + TypeName(method->self) + "." + method->name + " of ";
                AppendRepr(out, method->self, active, depth + 1);
                out.push_back('>');
                return;
            }
            out += "<built-in method " + method->name + " of " + TypeName(method->self) + " object>";
            return;
        }
        case ValueKind::kExceptionType:
            out += "<class '" + value.AsExceptionType()->name + "'>";
            return;
        case ValueKind::kException: {
            const auto exception = value.AsException();
            out += exception->type->name + "(";
            AppendSequence(out, exception->args, active, depth);
            out += ")";
            return;
        }
        case ValueKind::kOpaque:
            out += value.AsOpaque()->repr;
            return;
    }
}

bool EqualsImpl(const Value& lhs, const Value& rhs, int depth);

bool SequenceEquals(const std::vector<Value>& lhs, const std::vector<Value>& rhs, int depth) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!EqualsImpl(lhs[i], rhs[i], depth + 1)) {
            return false;
        }
    }
    return true;
}

bool NumberEquals(const Value& lhs, const Value& rhs) {
    if (lhs.IsIntegral() && rhs.IsIntegral()) {
        return lhs.AsInt() == rhs.AsInt();
    }
    const double left = lhs.AsDouble();
    const double right = rhs.AsDouble();
    // int vs float compares exactly when the float is integral and in range.
    if (lhs.IsIntegral() && std::isfinite(right) && std::trunc(right) == right &&
        std::fabs(right) < 9.2e18) {
        return lhs.AsInt() == static_cast<std::int64_t>(right);
    }
    if (rhs.IsIntegral() && std::isfinite(left) && std::trunc(left) == left &&
        std::fabs(left) < 9.2e18) {
        return rhs.AsInt() == static_cast<std::int64_t>(left);
    }
    return left == right;
}

bool EqualsImpl(const Value& lhs, const Value& rhs, int depth) {
    if (depth > kMaxCompareDepth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded in comparison");
    }
    if (lhs.IsNumber() && rhs.IsNumber()) {
        return NumberEquals(lhs, rhs);
    }
    if (lhs.kind() == ValueKind::kInstance || rhs.kind() == ValueKind::kInstance) {
        if (auto result = CallSpecial(lhs, "__eq__", {rhs})) {
            return Truthy(*result);
        }
        if (auto result = CallSpecial(rhs, "__eq__", {lhs})) {
            return Truthy(*result);
        }
        return lhs.Identity() == rhs.Identity();
    }
    if (lhs.IsAnySet() && rhs.IsAnySet()) {
        const auto left = lhs.AsSet();
        const auto right = rhs.AsSet();
        if (left->size() != right->size()) {
            return false;
        }
        for (const auto& item : left->items) {
            if (!right->Contains(item)) {
                return false;
            }
        }
        return true;
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case ValueKind::kNone:
            return true;
        case ValueKind::kStr:
            return lhs.AsStr() == rhs.AsStr();
        case ValueKind::kList:
            return lhs.Identity() == rhs.Identity() ||
                   SequenceEquals(lhs.AsList()->items, rhs.AsList()->items, depth);
        case ValueKind::kTuple:
            return SequenceEquals(lhs.AsTuple()->items, rhs.AsTuple()->items, depth);
        case ValueKind::kDict: {
            if (lhs.Identity() == rhs.Identity()) {
                return true;
            }
            const auto left = lhs.AsDict();
            const auto right = rhs.AsDict();
            if (left->size() != right->size()) {
                return false;
            }
            for (const auto& [key, value] : left->entries) {
                const Value* other = right->Find(key);
                if (other == nullptr || !EqualsImpl(value, *other, depth + 1)) {
                    return false;
                }
            }
            return true;
        }
        case ValueKind::kSlice: {
            const auto left = lhs.AsSlice();
            const auto right = rhs.AsSlice();
            return EqualsImpl(left->start, right->start, depth + 1) &&
                   EqualsImpl(left->stop, right->stop, depth + 1) &&
                   EqualsImpl(left->step, right->step, depth + 1);
        }
        case ValueKind::kRange: {
            const auto left = lhs.AsRange();
            const auto right = rhs.AsRange();
            const auto length = left->Count();
            if (length != right->Count()) {
                return false;
            }
            if (length == 0) {
                return true;
            }
            if (left->start != right->start) {
                return false;
            }
            return length == 1 || left->step == right->step;
        }
        case ValueKind::kBoundMethod: {
            const auto left = lhs.AsBoundMethod();
            const auto right = rhs.AsBoundMethod();
            return left->name == right->name && left->self.Identity() == right->self.Identity() &&
                   left->function.Identity() == right->function.Identity();
        }
        default:
            return lhs.Identity() == rhs.Identity();
    }
}

int CompareSequences(const std::vector<Value>& lhs,
                     const std::vector<Value>& rhs,
                     const std::string& op) {
    const std::size_t common = std::min(lhs.size(), rhs.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (!Equals(lhs[i], rhs[i])) {
            return CompareValues(lhs[i], rhs[i], op);
        }
    }
    if (lhs.size() == rhs.size()) {
        return 0;
    }
    return lhs.size() < rhs.size() ? -1 : 1;
}

std::size_t CombineHash(std::size_t seed, std::size_t value) {
    return seed ^ (value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
}

void RebuildIndexFrom(std::unordered_map<Value, std::size_t, ValueHasher, ValueEqual>& index,
                      std::size_t removed) {
    for (auto& [key, position] : index) {
        if (position > removed) {
            --position;
        }
    }
}

std::size_t HashImpl(const Value& value, int depth) {
    if (depth > kMaxNestingDepth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded while hashing");
    }
    switch (value.kind()) {
        case ValueKind::kNone:
            return 0x4e6f6e65U;
        case ValueKind::kBool:
        case ValueKind::kInt:
            return std::hash<std::int64_t>{}(value.AsInt());
        case ValueKind::kFloat: {
            const double number = value.AsDouble();
            if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < 9.2e18) {
                return std::hash<std::int64_t>{}(static_cast<std::int64_t>(number));
            }
            return std::hash<double>{}(number);
        }
        case ValueKind::kStr:
            return std::hash<std::string>{}(value.AsStr());
        case ValueKind::kTuple: {
            std::size_t seed = 0x7475706cU;
            for (const auto& item : value.AsTuple()->items) {
                seed = CombineHash(seed, HashImpl(item, depth + 1));
            }
            return seed;
        }
        case ValueKind::kRange: {
            const auto range = value.AsRange();
            std::size_t seed = std::hash<std::int64_t>{}(range->start);
            seed = CombineHash(seed, std::hash<std::int64_t>{}(range->stop));
            return CombineHash(seed, std::hash<std::int64_t>{}(range->step));
        }
        case ValueKind::kFrozenSet: {
            // Order independent, so equal sets hash alike.
            std::size_t seed = 0x66726f7aU;
            for (const auto& item : value.AsSet()->items) {
                const std::size_t hash = HashImpl(item, depth + 1);
                seed ^= (hash ^ (hash << 16) ^ 89869747ULL) * 3644798167ULL;
            }
            return seed;
        }
        case ValueKind::kInstance: {
            if (auto result = CallSpecial(value, "__hash__")) {
                if (!result->IsIntegral()) {
                    ThrowError("TypeError", "__hash__ method should return an integer");
                }
                return std::hash<std::int64_t>{}(result->AsInt());
            }
            if (DefinesSpecial(value, "__eq__")) {
                ThrowError("TypeError", "unhashable type: '" + TypeName(value) + "'");
            }
            return std::hash<const void*>{}(value.Identity());
        }
        case ValueKind::kList:
        case ValueKind::kDict:
        case ValueKind::kSet:
        case ValueKind::kSlice:
            ThrowError("TypeError", "unhashable type: '" + TypeName(value) + "'");
        case ValueKind::kBoundMethod: {
            const auto method = value.AsBoundMethod();
            return CombineHash(std::hash<const void*>{}(method->self.Identity()),
                               std::hash<std::string>{}(method->name));
        }
        default:
            return std::hash<const void*>{}(value.Identity());
    }
}

Value DeepCopyImpl(const Value& value, int depth) {
    if (depth > kMaxNestingDepth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded while copying");
    }
    switch (value.kind()) {
        case ValueKind::kList: {
            std::vector<Value> items;
            for (const auto& item : value.AsList()->items) {
                items.push_back(DeepCopyImpl(item, depth + 1));
            }
            return Value::List(std::move(items));
        }
        case ValueKind::kTuple: {
            std::vector<Value> items;
            for (const auto& item : value.AsTuple()->items) {
                items.push_back(DeepCopyImpl(item, depth + 1));
            }
            return Value::Tuple(std::move(items));
        }
        case ValueKind::kDict: {
            Value copy = Value::Dict();
            for (const auto& [key, item] : value.AsDict()->entries) {
                copy.AsDict()->Set(key, DeepCopyImpl(item, depth + 1));
            }
            return copy;
        }
        case ValueKind::kSet: {
            Value copy = Value::Set();
            for (const auto& item : value.AsSet()->items) {
                copy.AsSet()->Add(item);
            }
            return copy;
        }
        default:
            return value;
    }
}

}  // namespace

Value Value::Bool(bool value) {
    Value result;
    result.kind_ = ValueKind::kBool;
    result.data_ = value;
    return result;
}

Value Value::Int(std::int64_t value) {
    Value result;
    result.kind_ = ValueKind::kInt;
    result.data_ = value;
    return result;
}

Value Value::Float(double value) {
    Value result;
    result.kind_ = ValueKind::kFloat;
    result.data_ = value;
    return result;
}

Value Value::Str(std::string value) {
    Value result;
    result.kind_ = ValueKind::kStr;
    result.data_ = std::move(value);
    return result;
}

Value Value::List(std::vector<Value> items) {
    auto list = std::make_shared<ListObject>();
    list->items = std::move(items);
    TrackObject(list);
    return FromObject(ValueKind::kList, std::move(list));
}

Value Value::Tuple(std::vector<Value> items) {
    auto tuple = std::make_shared<TupleObject>();
    tuple->items = std::move(items);
    return FromObject(ValueKind::kTuple, std::move(tuple));
}

Value Value::Dict() {
    auto dict = std::make_shared<DictObject>();
    TrackObject(dict);
    return FromObject(ValueKind::kDict, std::move(dict));
}

Value Value::Set() {
    auto set = std::make_shared<SetObject>();
    TrackObject(set);
    return FromObject(ValueKind::kSet, std::move(set));
}

Value Value::FrozenSet() {
    return FromObject(ValueKind::kFrozenSet, std::make_shared<SetObject>());
}

Value Value::Range(std::int64_t start, std::int64_t stop, std::int64_t step) {
    auto range = std::make_shared<RangeObject>();
    range->start = start;
    range->stop = stop;
    range->step = step;
    return FromObject(ValueKind::kRange, std::move(range));
}

Value Value::Slice(Value start, Value stop, Value step) {
    auto slice = std::make_shared<SliceObject>();
    slice->start = std::move(start);
    slice->stop = std::move(stop);
    slice->step = std::move(step);
    return FromObject(ValueKind::kSlice, std::move(slice));
}

Value Value::FromObject(ValueKind kind, std::shared_ptr<Object> object) {
    Value result;
    result.kind_ = kind;
    result.data_ = std::move(object);
    return result;
}

Value Value::FromExceptionType(std::shared_ptr<const ExceptionType> type) {
    return FromObject(ValueKind::kExceptionType, std::const_pointer_cast<ExceptionType>(std::move(type)));
}

std::int64_t Value::AsInt() const {
    if (kind_ == ValueKind::kBool) {
        return std::get<bool>(data_) ? 1 : 0;
    }
    return std::get<std::int64_t>(data_);
}

double Value::AsDouble() const {
    switch (kind_) {
        case ValueKind::kBool: return std::get<bool>(data_) ? 1.0 : 0.0;
        case ValueKind::kInt: return static_cast<double>(std::get<std::int64_t>(data_));
        default: return std::get<double>(data_);
    }
}

std::shared_ptr<ListObject> Value::AsList() const { return Cast<ListObject>(data_); }
std::shared_ptr<TupleObject> Value::AsTuple() const { return Cast<TupleObject>(data_); }
std::shared_ptr<DictObject> Value::AsDict() const { return Cast<DictObject>(data_); }
std::shared_ptr<SetObject> Value::AsSet() const { return Cast<SetObject>(data_); }
std::shared_ptr<RangeObject> Value::AsRange() const { return Cast<RangeObject>(data_); }
std::shared_ptr<IteratorObject> Value::AsIterator() const { return Cast<IteratorObject>(data_); }
std::shared_ptr<FunctionObject> Value::AsFunction() const { return Cast<FunctionObject>(data_); }
std::shared_ptr<BuiltinFunction> Value::AsBuiltin() const { return Cast<BuiltinFunction>(data_); }
std::shared_ptr<BoundMethod> Value::AsBoundMethod() const { return Cast<BoundMethod>(data_); }
std::shared_ptr<const ExceptionType> Value::AsExceptionType() const { return Cast<ExceptionType>(data_); }
std::shared_ptr<ExceptionObject> Value::AsException() const { return Cast<ExceptionObject>(data_); }
std::shared_ptr<SliceObject> Value::AsSlice() const { return Cast<SliceObject>(data_); }
std::shared_ptr<ClassObject> Value::AsClass() const { return Cast<ClassObject>(data_); }
std::shared_ptr<InstanceObject> Value::AsInstance() const { return Cast<InstanceObject>(data_); }
std::shared_ptr<OpaqueObject> Value::AsOpaque() const { return Cast<OpaqueObject>(data_); }

const Object* Value::Identity() const {
    if (const auto* object = std::get_if<std::shared_ptr<Object>>(&data_)) {
        return object->get();
    }
    return nullptr;
}

std::shared_ptr<Object> Value::DetachObject() {
    auto* object = std::get_if<std::shared_ptr<Object>>(&data_);
    if (object == nullptr) {
        return nullptr;
    }
    auto detached = std::move(*object);
    data_ = std::monostate{};
    kind_ = ValueKind::kNone;
    return detached;
}

std::size_t ValueHasher::operator()(const Value& value) const {
    return Hash(value);
}

bool ValueEqual::operator()(const Value& lhs, const Value& rhs) const {
    return Equals(lhs, rhs);
}

ListObject::~ListObject() {
    for (auto& item : items) {
        Park(item);
    }
    Drain();
}

void ListObject::ReleaseChildren() {
    std::vector<Value> released;
    released.swap(items);
}

TupleObject::~TupleObject() {
    for (auto& item : items) {
        Park(item);
    }
    Drain();
}

DictObject::~DictObject() {
    index.clear();
    for (auto& [key, value] : entries) {
        Park(key);
        Park(value);
    }
    Drain();
}

SetObject::~SetObject() {
    index.clear();
    for (auto& item : items) {
        Park(item);
    }
    Drain();
}

ClassObject::~ClassObject() {
    ParkAttributes(attributes);
    Drain();
}

void ClassObject::ReleaseChildren() {
    std::unordered_map<std::string, Value> released;
    released.swap(attributes);
}

const Value* ClassObject::Lookup(const std::string& attribute) const {
    auto it = attributes.find(attribute);
    if (it != attributes.end()) {
        return &it->second;
    }
    for (const auto& ancestor : ancestors) {
        auto found = ancestor->attributes.find(attribute);
        if (found != ancestor->attributes.end()) {
            return &found->second;
        }
    }
    return nullptr;
}

bool ClassObject::IsSubclassOf(const ClassObject& other) const {
    if (this == &other) {
        return true;
    }
    return std::any_of(ancestors.begin(), ancestors.end(),
                       [&](const std::shared_ptr<ClassObject>& ancestor) { return ancestor.get() == &other; });
}

InstanceObject::~InstanceObject() {
    ParkAttributes(attributes);
    Drain();
}

void InstanceObject::ReleaseChildren() {
    std::unordered_map<std::string, Value> released;
    released.swap(attributes);
}

void FunctionObject::ReleaseChildren() {
    std::vector<Value> released;
    released.swap(defaults);
}

HooksScope::HooksScope(ExecutionHooks* hooks) : previous_(current_hooks) {
    current_hooks = hooks;
}

HooksScope::~HooksScope() {
    current_hooks = previous_;
}

ExecutionHooks* CurrentHooks() {
    return current_hooks;
}

Value* DictObject::Find(const Value& key) {
    Hash(key);
    auto it = index.find(key);
    if (it == index.end()) {
        return nullptr;
    }
    return &entries[it->second].second;
}

void DictObject::Set(const Value& key, Value value) {
    Hash(key);
    auto it = index.find(key);
    if (it != index.end()) {
        entries[it->second].second = std::move(value);
        return;
    }
    entries.emplace_back(key, std::move(value));
    index.emplace(key, entries.size() - 1);
}

bool DictObject::Erase(const Value& key) {
    Hash(key);
    auto it = index.find(key);
    if (it == index.end()) {
        return false;
    }
    const std::size_t position = it->second;
    index.erase(it);
    entries.erase(entries.begin() + static_cast<std::ptrdiff_t>(position));
    RebuildIndexFrom(index, position);
    return true;
}

void DictObject::Clear() {
    entries.clear();
    index.clear();
}

bool SetObject::Contains(const Value& item) const {
    Hash(item);
    return index.find(item) != index.end();
}

bool SetObject::Add(const Value& item) {
    Hash(item);
    if (index.find(item) != index.end()) {
        return false;
    }
    items.push_back(item);
    index.emplace(item, items.size() - 1);
    return true;
}

bool SetObject::Erase(const Value& item) {
    Hash(item);
    auto it = index.find(item);
    if (it == index.end()) {
        return false;
    }
    const std::size_t position = it->second;
    index.erase(it);
    items.erase(items.begin() + static_cast<std::ptrdiff_t>(position));
    RebuildIndexFrom(index, position);
    return true;
}

void SetObject::Clear() {
    items.clear();
    index.clear();
}

std::uint64_t StepCount(std::int64_t start, std::int64_t stop, std::int64_t step) {
    if (step > 0 && start < stop) {
        const std::uint64_t span = static_cast<std::uint64_t>(stop) - static_cast<std::uint64_t>(start);
        return (span - 1) / static_cast<std::uint64_t>(step) + 1;
    }
    if (step < 0 && start > stop) {
        const std::uint64_t span = static_cast<std::uint64_t>(start) - static_cast<std::uint64_t>(stop);
        const std::uint64_t magnitude = static_cast<std::uint64_t>(-(step + 1)) + 1;
        return (span - 1) / magnitude + 1;
    }
    return 0;
}

std::int64_t RangeObject::Length() const {
    const std::uint64_t count = Count();
    if (count > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        ThrowError("OverflowError", "Python int too large to convert to C ssize_t");
    }
    return static_cast<std::int64_t>(count);
}

const Value* CallArguments::Keyword(const std::string& name) const {
    for (const auto& [key, value] : keywords) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

bool ExceptionType::IsSubclassOf(const ExceptionType& other) const {
    for (const ExceptionType* type = this; type != nullptr; type = type->base.get()) {
        if (type == &other) {
            return true;
        }
    }
    return false;
}

std::string TypeName(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return "NoneType";
        case ValueKind::kBool: return "bool";
        case ValueKind::kInt: return "int";
        case ValueKind::kFloat: return "float";
        case ValueKind::kStr: return "str";
        case ValueKind::kList: return "list";
        case ValueKind::kTuple: return "tuple";
        case ValueKind::kDict: return "dict";
        case ValueKind::kSet: return "set";
        case ValueKind::kFrozenSet: return "frozenset";
        case ValueKind::kRange: return "range";
        case ValueKind::kSlice: return "slice";
        case ValueKind::kClass: return "type";
        case ValueKind::kInstance: return value.AsInstance()->cls->name;
        case ValueKind::kIterator: return value.AsIterator()->type_name;
        case ValueKind::kFunction: return "function";
        case ValueKind::kBuiltin:
            return value.AsBuiltin()->constructs.empty() ? "builtin_function_or_method" : "type";
        case ValueKind::kBoundMethod:
            return value.AsBoundMethod()->function.IsNone() ? "builtin_function_or_method" : "method";
        case ValueKind::kExceptionType: return "type";
        case ValueKind::kException: return value.AsException()->type->name;
        case ValueKind::kOpaque: return value.AsOpaque()->type_name;
    }
    return "object";
}

std::string Repr(const Value& value) {
    std::string out;
    std::vector<const Object*> active;
    AppendRepr(out, value, active, 0);
    return out;
}

std::string Str(const Value& value) {
    if (value.IsStr()) {
        return value.AsStr();
    }
    if (value.kind() == ValueKind::kException) {
        return ExceptionMessage(*value.AsException());
    }
    if (auto text = CallSpecial(value, "__str__")) {
        if (!text->IsStr()) {
            ThrowError("TypeError", "__str__ returned non-string (type " + TypeName(*text) + ")");
        }
        return text->AsStr();
    }
    return Repr(value);
}

bool Truthy(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kNone: return false;
        case ValueKind::kBool: return value.AsBool();
        case ValueKind::kInt: return value.AsInt() != 0;
        case ValueKind::kFloat: return value.AsDouble() != 0.0;
        case ValueKind::kStr: return !value.AsStr().empty();
        case ValueKind::kList: return !value.AsList()->items.empty();
        case ValueKind::kTuple: return !value.AsTuple()->items.empty();
        case ValueKind::kDict: return value.AsDict()->size() != 0;
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: return value.AsSet()->size() != 0;
        case ValueKind::kRange: return value.AsRange()->Count() != 0;
        case ValueKind::kInstance: {
            if (auto result = CallSpecial(value, "__bool__")) {
                if (!result->IsBool()) {
                    ThrowError("TypeError", "__bool__ should return bool, returned " + TypeName(*result));
                }
                return result->AsBool();
            }
            if (auto result = CallSpecial(value, "__len__")) {
                if (!result->IsIntegral()) {
                    ThrowError("TypeError", "'" + TypeName(*result) + "' object cannot be interpreted as an integer");
                }
                return result->AsInt() != 0;
            }
            return true;
        }
        case ValueKind::kIterator: {
            const auto iterator = value.AsIterator();
            return !iterator->is_view || !iterator->snapshot.empty();
        }
        default: return true;
    }
}

bool Equals(const Value& lhs, const Value& rhs) {
    return EqualsImpl(lhs, rhs, 0);
}

int CompareValues(const Value& lhs, const Value& rhs, const std::string& op) {
    if (lhs.kind() == ValueKind::kInstance || rhs.kind() == ValueKind::kInstance) {
        static const std::unordered_map<std::string, std::pair<std::string, std::string>> kMethods = {
            {"<", {"__lt__", "__gt__"}},
            {"<=", {"__le__", "__ge__"}},
            {">", {"__gt__", "__lt__"}},
            {">=", {"__ge__", "__le__"}},
        };
        auto it = kMethods.find(op);
        if (it != kMethods.end()) {
            std::optional<Value> result = CallSpecial(lhs, it->second.first, {rhs});
            if (!result) {
                result = CallSpecial(rhs, it->second.second, {lhs});
            }
            if (result) {
                // Encoded so that the caller's test of the sign against op holds.
                const bool less_side = op[0] == '<';
                return Truthy(*result) == less_side ? -1 : 1;
            }
        }
    }
    if (lhs.IsNumber() && rhs.IsNumber()) {
        if (lhs.IsIntegral() && rhs.IsIntegral()) {
            const auto left = lhs.AsInt();
            const auto right = rhs.AsInt();
            return left < right ? -1 : (left > right ? 1 : 0);
        }
        const double left = lhs.AsDouble();
        const double right = rhs.AsDouble();
        return left < right ? -1 : (left > right ? 1 : 0);
    }
    if (lhs.IsStr() && rhs.IsStr()) {
        const int result = lhs.AsStr().compare(rhs.AsStr());
        return result < 0 ? -1 : (result > 0 ? 1 : 0);
    }
    if (lhs.kind() == ValueKind::kList && rhs.kind() == ValueKind::kList) {
        return CompareSequences(lhs.AsList()->items, rhs.AsList()->items, op);
    }
    if (lhs.kind() == ValueKind::kTuple && rhs.kind() == ValueKind::kTuple) {
        return CompareSequences(lhs.AsTuple()->items, rhs.AsTuple()->items, op);
    }
    ThrowError("TypeError", "'" + op + "' not supported between instances of '" + TypeName(lhs) +
                                "' and '" + TypeName(rhs) + "'");
}

bool LessThan(const Value& lhs, const Value& rhs) {
    if (lhs.IsNumber() && rhs.IsNumber() && (lhs.IsFloat() || rhs.IsFloat())) {
        return lhs.AsDouble() < rhs.AsDouble();
    }
    if (lhs.IsAnySet() && rhs.IsAnySet()) {
        const auto left = lhs.AsSet();
        const auto right = rhs.AsSet();
        if (left->size() >= right->size()) {
            return false;
        }
        return std::all_of(left->items.begin(), left->items.end(),
                           [&](const Value& item) { return right->Contains(item); });
    }
    return CompareValues(lhs, rhs, "<") < 0;
}

std::size_t Hash(const Value& value) {
    return HashImpl(value, 0);
}

std::string FormatFloat(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    char buffer[64];
    const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value, std::chars_format::scientific);
    std::string text(buffer, result.ptr);

    std::string sign;
    std::size_t pos = 0;
    if (!text.empty() && text[0] == '-') {
        sign = "-";
        pos = 1;
    }
    const auto e_pos = text.find('e');
    std::string digits;
    for (std::size_t i = pos; i < e_pos; ++i) {
        if (text[i] != '.') {
            digits.push_back(text[i]);
        }
    }
    const int exponent = std::stoi(text.substr(e_pos + 1));

    std::string out = sign;
    if (exponent >= -4 && exponent < 16) {
        if (exponent >= 0) {
            const auto int_len = static_cast<std::size_t>(exponent) + 1;
            if (digits.size() <= int_len) {
                out += digits + std::string(int_len - digits.size(), '0') + ".0";
            } else {
                out += digits.substr(0, int_len) + "." + digits.substr(int_len);
            }
        } else {
            out += "0." + std::string(static_cast<std::size_t>(-exponent - 1), '0') + digits;
        }
        return out;
    }
    out.push_back(digits[0]);
    if (digits.size() > 1) {
        out += "." + digits.substr(1);
    }
    out += exponent < 0 ? "e-" : "e+";
    const int magnitude = exponent < 0 ? -exponent : exponent;
    if (magnitude < 10) {
        out.push_back('0');
    }
    out += std::to_string(magnitude);
    return out;
}

std::string ExceptionMessage(const ExceptionObject& exception) {
    if (exception.args.empty()) {
        return "";
    }
    if (exception.args.size() == 1) {
        if (exception.type->name == "KeyError") {
            return Repr(exception.args[0]);
        }
        return Str(exception.args[0]);
    }
    return Repr(Value::Tuple(exception.args));
}

const std::vector<std::shared_ptr<const ExceptionType>>& BuiltinExceptionTypes() {
    static const std::vector<std::shared_ptr<const ExceptionType>> kTypes = [] {
        std::vector<std::shared_ptr<const ExceptionType>> types;
        auto add = [&types](const std::string& name, const std::string& base) {
            auto type = std::make_shared<ExceptionType>();
            type->name = name;
            for (const auto& existing : types) {
                if (existing->name == base) {
                    type->base = existing;
                }
            }
            types.push_back(std::move(type));
        };
        add("Exception", "");
        add("ArithmeticError", "Exception");
        add("ZeroDivisionError", "ArithmeticError");
        add("OverflowError", "ArithmeticError");
        add("LookupError", "Exception");
        add("IndexError", "LookupError");
        add("KeyError", "LookupError");
        add("ValueError", "Exception");
        add("TypeError", "Exception");
        add("NameError", "Exception");
        add("UnboundLocalError", "NameError");
        add("AttributeError", "Exception");
        add("RuntimeError", "Exception");
        add("RecursionError", "RuntimeError");
        add("NotImplementedError", "RuntimeError");
        add("StopIteration", "Exception");
        add("AssertionError", "Exception");
        add("MemoryError", "Exception");
        add("ImportError", "Exception");
        return types;
    }();
    return kTypes;
}

std::shared_ptr<const ExceptionType> FindExceptionType(const std::string& name) {
    for (const auto& type : BuiltinExceptionTypes()) {
        if (type->name == name) {
            return type;
        }
    }
    return nullptr;
}

Value MakeException(const std::string& type_name, const std::string& message) {
    auto exception = std::make_shared<ExceptionObject>();
    exception->type = FindExceptionType(type_name);
    if (!exception->type) {
        exception->type = FindExceptionType("Exception");
    }
    if (!message.empty()) {
        exception->args.push_back(Value::Str(message));
    }
    return Value::FromObject(ValueKind::kException, std::move(exception));
}

Value DeepCopy(const Value& value) {
    return DeepCopyImpl(value, 0);
}

bool IsAscii(const std::string& text) {
    return std::all_of(text.begin(), text.end(), [](char ch) {
        return static_cast<unsigned char>(ch) < 0x80;
    });
}

std::u32string DecodeUtf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        char32_t code_point = lead;
        if (lead >= 0xF0 && lead < 0xF8) {
            extra = 3;
            code_point = lead & 0x07;
        } else if (lead >= 0xE0 && lead < 0xF0) {
            extra = 2;
            code_point = lead & 0x0F;
        } else if (lead >= 0xC0 && lead < 0xE0) {
            extra = 1;
            code_point = lead & 0x1F;
        }
        bool valid = extra > 0 && i + extra < text.size();
        if (valid) {
            for (std::size_t k = 1; k <= extra; ++k) {
                const auto cont = static_cast<unsigned char>(text[i + k]);
                if ((cont & 0xC0) != 0x80) {
                    valid = false;
                    break;
                }
                code_point = (code_point << 6) | (cont & 0x3F);
            }
        }
        if (valid) {
            out.push_back(code_point);
            i += extra + 1;
        } else {
            out.push_back(lead);
            ++i;
        }
    }
    return out;
}

std::string EncodeUtf8(char32_t code_point) {
    std::string out;
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
    return out;
}

std::string EncodeUtf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char32_t code_point : text) {
        out += EncodeUtf8(code_point);
    }
    return out;
}

std::size_t CodePointLength(const std::string& text) {
    if (IsAscii(text)) {
        return text.size();
    }
    return DecodeUtf8(text).size();
}

SyntaxError::SyntaxError(std::string kind, const std::string& message, int line, int column)
    : std::runtime_error(kind + ": " + message)
    , kind_(std::move(kind))
    , message_(message)
    , line_(line)
    , column_(column) {}

ScriptException::ScriptException(Value exception, int line)
    : exception_(std::move(exception))
    , line_(line) {
    what_ = TypeName();
    const auto message = Message();
    if (!message.empty()) {
        what_ += ": " + message;
    }
}

std::string ScriptException::TypeName() const {
    return exception_.AsException()->type->name;
}

std::string ScriptException::Message() const {
    return ExceptionMessage(*exception_.AsException());
}

void ThrowError(const std::string& type_name, const std::string& message) {
    throw ScriptException(MakeException(type_name, message));
}

void ThrowKeyError(const Value& key) {
    auto exception = std::make_shared<ExceptionObject>();
    exception->type = FindExceptionType("KeyError");
    exception->args.push_back(key);
    throw ScriptException(Value::FromObject(ValueKind::kException, std::move(exception)));
}

}  // namespace evalbox::lang
