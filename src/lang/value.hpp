#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace evalbox::lang {

class Interpreter;
class Scope;
struct FunctionDef;

enum class ValueKind {
    kNone,
    kBool,
    kInt,
    kFloat,
    kStr,
    kList,
    kTuple,
    kDict,
    kSet,
    kFrozenSet,
    kRange,
    kSlice,
    kIterator,
    kFunction,
    kBuiltin,
    kBoundMethod,
    kExceptionType,
    kException,
    kClass,
    kInstance,
    kOpaque
};

struct Object {
    virtual ~Object() = default;

    // Drops references to other values; breaks reference cycles on teardown.
    virtual void ReleaseChildren() {}
};

struct ListObject;
struct TupleObject;
struct DictObject;
struct SetObject;
struct RangeObject;
struct SliceObject;
struct IteratorObject;
struct FunctionObject;
struct BuiltinFunction;
struct BoundMethod;
struct ExceptionType;
struct ExceptionObject;
struct ClassObject;
struct InstanceObject;
struct OpaqueObject;

class Value {
public:
    Value() = default;

    static Value None() { return Value(); }
    static Value Bool(bool value);
    static Value Int(std::int64_t value);
    static Value Float(double value);
    static Value Str(std::string value);
    static Value List(std::vector<Value> items = {});
    static Value Tuple(std::vector<Value> items = {});
    static Value Dict();
    static Value Set();
    static Value FrozenSet();
    static Value Range(std::int64_t start, std::int64_t stop, std::int64_t step);
    static Value Slice(Value start, Value stop, Value step);
    static Value FromObject(ValueKind kind, std::shared_ptr<Object> object);
    static Value FromExceptionType(std::shared_ptr<const ExceptionType> type);

    ValueKind kind() const { return kind_; }
    bool IsNone() const { return kind_ == ValueKind::kNone; }
    bool IsBool() const { return kind_ == ValueKind::kBool; }
    bool IsInt() const { return kind_ == ValueKind::kInt; }
    bool IsFloat() const { return kind_ == ValueKind::kFloat; }
    bool IsStr() const { return kind_ == ValueKind::kStr; }
    // bool, int and float all take part in arithmetic.
    bool IsNumber() const {
        return kind_ == ValueKind::kBool || kind_ == ValueKind::kInt || kind_ == ValueKind::kFloat;
    }
    // bool and int: the integral numbers.
    bool IsIntegral() const { return kind_ == ValueKind::kBool || kind_ == ValueKind::kInt; }
    bool IsCallable() const {
        return kind_ == ValueKind::kFunction || kind_ == ValueKind::kBuiltin ||
               kind_ == ValueKind::kBoundMethod || kind_ == ValueKind::kExceptionType ||
               kind_ == ValueKind::kClass;
    }
    // set and frozenset share SetObject.
    bool IsAnySet() const { return kind_ == ValueKind::kSet || kind_ == ValueKind::kFrozenSet; }

    bool AsBool() const { return std::get<bool>(data_); }
    std::int64_t AsInt() const;  // accepts bool
    double AsDouble() const;     // accepts bool, int, float
    const std::string& AsStr() const { return std::get<std::string>(data_); }

    std::shared_ptr<ListObject> AsList() const;
    std::shared_ptr<TupleObject> AsTuple() const;
    std::shared_ptr<DictObject> AsDict() const;
    std::shared_ptr<SetObject> AsSet() const;
    std::shared_ptr<RangeObject> AsRange() const;
    std::shared_ptr<SliceObject> AsSlice() const;
    std::shared_ptr<IteratorObject> AsIterator() const;
    std::shared_ptr<FunctionObject> AsFunction() const;
    std::shared_ptr<BuiltinFunction> AsBuiltin() const;
    std::shared_ptr<BoundMethod> AsBoundMethod() const;
    std::shared_ptr<const ExceptionType> AsExceptionType() const;
    std::shared_ptr<ExceptionObject> AsException() const;
    std::shared_ptr<ClassObject> AsClass() const;
    std::shared_ptr<InstanceObject> AsInstance() const;
    std::shared_ptr<OpaqueObject> AsOpaque() const;

    const Object* Identity() const;
    // Moves the held object out and leaves None behind; null for scalars.
    std::shared_ptr<Object> DetachObject();

private:
    ValueKind kind_ = ValueKind::kNone;
    std::variant<std::monostate, bool, std::int64_t, double, std::string, std::shared_ptr<Object>> data_;
};

struct ValueHasher {
    std::size_t operator()(const Value& value) const;
};

struct ValueEqual {
    bool operator()(const Value& lhs, const Value& rhs) const;
};

// Container destructors hand their children to a per-thread queue drained by
// the outermost release, so dropping a deeply nested value does not recurse.
struct ListObject : Object {
    ~ListObject() override;
    void ReleaseChildren() override;

    std::vector<Value> items;
};

struct TupleObject : Object {
    ~TupleObject() override;

    std::vector<Value> items;
};

// Insertion ordered; keys are validated as hashable before they reach the index.
struct DictObject : Object {
    ~DictObject() override;
    void ReleaseChildren() override { Clear(); }

    std::vector<std::pair<Value, Value>> entries;
    std::unordered_map<Value, std::size_t, ValueHasher, ValueEqual> index;

    Value* Find(const Value& key);
    void Set(const Value& key, Value value);
    bool Erase(const Value& key);
    std::size_t size() const { return entries.size(); }
    void Clear();
};

struct SetObject : Object {
    ~SetObject() override;
    void ReleaseChildren() override { Clear(); }

    std::vector<Value> items;
    std::unordered_map<Value, std::size_t, ValueHasher, ValueEqual> index;

    bool Contains(const Value& item) const;
    bool Add(const Value& item);
    bool Erase(const Value& item);
    std::size_t size() const { return items.size(); }
    void Clear();
};

// Number of values start, start + step, ... strictly before stop. Exact for
// the whole int64 domain; step must be non-zero.
std::uint64_t StepCount(std::int64_t start, std::int64_t stop, std::int64_t step);

struct RangeObject : Object {
    std::int64_t start = 0;
    std::int64_t stop = 0;
    std::int64_t step = 1;

    std::uint64_t Count() const { return StepCount(start, stop, step); }
    // Count() as a Python length; raises OverflowError past int64.
    std::int64_t Length() const;
    // index must be below Count(), so the result always lies inside the range.
    std::int64_t At(std::uint64_t index) const {
        return static_cast<std::int64_t>(static_cast<std::uint64_t>(start) +
                                         index * static_cast<std::uint64_t>(step));
    }
};

struct SliceObject : Object {
    Value start;
    Value stop;
    Value step;
};

// Lazy iterator. Views (dict_keys and friends) keep a snapshot and can be
// iterated repeatedly; everything else is consumed by iteration.
struct IteratorObject : Object {
    std::string type_name;
    std::function<std::optional<Value>()> next;
    bool is_view = false;
    std::vector<Value> snapshot;
};

struct FunctionObject : Object {
    void ReleaseChildren() override;

    std::shared_ptr<const FunctionDef> def;
    std::vector<Value> defaults;
    std::shared_ptr<Scope> closure;
};

struct CallArguments {
    std::vector<Value> positional;
    std::vector<std::pair<std::string, Value>> keywords;

    const Value* Keyword(const std::string& name) const;
};

using BuiltinCallable = std::function<Value(Interpreter&, CallArguments&)>;

struct BuiltinFunction : Object {
    std::string name;
    BuiltinCallable fn;
    // Non-empty for constructors usable with isinstance(): the name of the type they build.
    std::string constructs;
};

// A builtin method looked up by name, or a user method when function is set.
struct BoundMethod : Object {
    Value self;
    std::string name;
    Value function;
};

struct ExceptionType : Object {
    std::string name;
    std::shared_ptr<const ExceptionType> base;

    bool IsSubclassOf(const ExceptionType& other) const;
};

struct ExceptionObject : Object {
    std::shared_ptr<const ExceptionType> type;
    std::vector<Value> args;
};

// A user-defined class. Exception subclasses become ExceptionTypes instead.
struct ClassObject : Object {
    ~ClassObject() override;
    void ReleaseChildren() override;

    std::string name;
    std::vector<std::shared_ptr<ClassObject>> bases;
    // C3 linearization after this class; the class itself is left out so the
    // order holds no reference cycle.
    std::vector<std::shared_ptr<ClassObject>> ancestors;
    std::unordered_map<std::string, Value> attributes;

    // Looks name up in this class and then its ancestors.
    const Value* Lookup(const std::string& attribute) const;
    bool IsSubclassOf(const ClassObject& other) const;
};

struct InstanceObject : Object {
    ~InstanceObject() override;
    void ReleaseChildren() override;

    std::shared_ptr<ClassObject> cls;
    std::unordered_map<std::string, Value> attributes;
};

// Stand-in for a value that cannot cross a process boundary (functions, iterators).
struct OpaqueObject : Object {
    std::string type_name;
    std::string repr;
};

// Services of the interpreter executing on the current thread. Value
// functions with no interpreter at hand reach allocation tracking and
// user-defined special methods through it.
class ExecutionHooks {
public:
    virtual ~ExecutionHooks() = default;

    // Sees every list, dict and set created while installed.
    virtual void Track(const std::shared_ptr<Object>& object) = 0;
    // Calls self.name(args...) when the instance's class defines name.
    virtual std::optional<Value> CallSpecial(const Value& self, const std::string& name,
                                             std::vector<Value> args) = 0;
};

// Installs hooks for the current thread; the previous hooks come back on
// destruction.
class HooksScope {
public:
    explicit HooksScope(ExecutionHooks* hooks);
    ~HooksScope();

    HooksScope(const HooksScope&) = delete;
    HooksScope& operator=(const HooksScope&) = delete;

private:
    ExecutionHooks* previous_;
};

ExecutionHooks* CurrentHooks();

std::string TypeName(const Value& value);
std::string Repr(const Value& value);
std::string Str(const Value& value);
bool Truthy(const Value& value);
bool Equals(const Value& lhs, const Value& rhs);
// Python's '<'; raises TypeError for unordered pairs.
bool LessThan(const Value& lhs, const Value& rhs);
// Three-way ordering of numbers, strings, lists and tuples. op names the
// comparison in the TypeError raised for other pairs.
int CompareValues(const Value& lhs, const Value& rhs, const std::string& op);
// Raises TypeError for unhashable values.
std::size_t Hash(const Value& value);
std::string FormatFloat(double value);
// Copies lists, tuples, dicts and sets recursively; immutable values are shared.
// Nesting past 500 levels raises RecursionError, as repr and hashing do.
Value DeepCopy(const Value& value);

// Message of an exception instance as str(e) shows it.
std::string ExceptionMessage(const ExceptionObject& exception);

// Builtin exception hierarchy, shared and immutable.
std::shared_ptr<const ExceptionType> FindExceptionType(const std::string& name);
const std::vector<std::shared_ptr<const ExceptionType>>& BuiltinExceptionTypes();
Value MakeException(const std::string& type_name, const std::string& message);

// UTF-8 helpers; invalid bytes decode as single code points.
bool IsAscii(const std::string& text);
std::u32string DecodeUtf8(const std::string& text);
std::string EncodeUtf8(char32_t code_point);
std::string EncodeUtf8(const std::u32string& text);
std::size_t CodePointLength(const std::string& text);

}  // namespace evalbox::lang
