#include "lang/interpreter.hpp"

#include <algorithm>
#include <limits>

#include "lang/methods.hpp"
#include "lang/operators.hpp"

namespace evalbox::lang {
namespace {

constexpr std::size_t kExhausted = std::numeric_limits<std::size_t>::max();
constexpr int kMaxExportDepth = 500;

class DepthGuard {
public:
    explicit DepthGuard(int& depth) : depth_(depth) { ++depth_; }
    ~DepthGuard() { --depth_; }

private:
    int& depth_;
};

template <typename T>
class PopGuard {
public:
    explicit PopGuard(std::vector<T>& stack) : stack_(stack) {}
    ~PopGuard() { stack_.pop_back(); }

private:
    std::vector<T>& stack_;
};

std::string DisplayName(const FunctionDef& def) {
    return def.is_lambda ? "<lambda>" : def.name;
}

std::string QuoteList(const std::vector<std::string>& names) {
    std::string out;
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += names.size() > 2 ? ", " : " ";
            if (i + 1 == names.size()) {
                out += "and ";
            }
        }
        out += "'" + names[i] + "'";
    }
    return out;
}

bool IsIterable(const Value& value) {
    switch (value.kind()) {
        case ValueKind::kStr:
        case ValueKind::kList:
        case ValueKind::kTuple:
        case ValueKind::kDict:
        case ValueKind::kSet:
        case ValueKind::kFrozenSet:
        case ValueKind::kRange:
        case ValueKind::kIterator:
            return true;
        case ValueKind::kInstance:
            return value.AsInstance()->cls->Lookup("__iter__") != nullptr;
        default:
            return false;
    }
}

bool IsStopIteration(const ScriptException& error) {
    static const auto kStopIteration = FindExceptionType("StopIteration");
    const Value& exception = error.exception();
    return exception.kind() == ValueKind::kException &&
           exception.AsException()->type->IsSubclassOf(*kStopIteration);
}

// C3 linearization of the class's bases, the class itself left out.
std::vector<std::shared_ptr<ClassObject>> Linearize(const ClassObject& cls) {
    using ClassList = std::vector<std::shared_ptr<ClassObject>>;
    std::vector<ClassList> sequences;
    for (const auto& base : cls.bases) {
        ClassList order{base};
        order.insert(order.end(), base->ancestors.begin(), base->ancestors.end());
        sequences.push_back(std::move(order));
    }
    sequences.push_back(cls.bases);

    ClassList result;
    while (true) {
        sequences.erase(std::remove_if(sequences.begin(), sequences.end(),
                                       [](const ClassList& sequence) { return sequence.empty(); }),
                        sequences.end());
        if (sequences.empty()) {
            return result;
        }
        std::shared_ptr<ClassObject> next;
        for (const auto& sequence : sequences) {
            const auto& head = sequence.front();
            const bool in_tail = std::any_of(sequences.begin(), sequences.end(), [&](const ClassList& other) {
                return std::find(other.begin() + 1, other.end(), head) != other.end();
            });
            if (!in_tail) {
                next = head;
                break;
            }
        }
        if (!next) {
            std::vector<std::string> names;
            for (const auto& base : cls.bases) {
                names.push_back(base->name);
            }
            ThrowError("TypeError", "Cannot create a consistent method resolution order (MRO) for bases " +
                                        QuoteList(names));
        }
        result.push_back(next);
        for (auto& sequence : sequences) {
            if (sequence.front() == next) {
                sequence.erase(sequence.begin());
            }
        }
    }
}

bool IsDocstring(const Stmt& stmt) {
    return stmt.kind == StmtKind::kExpr && stmt.value->kind == ExprKind::kConstant && stmt.value->constant.IsStr();
}

bool IsSetOperator(BinaryOperator op) {
    return op == BinaryOperator::kBitOr || op == BinaryOperator::kBitAnd || op == BinaryOperator::kSub ||
           op == BinaryOperator::kBitXor;
}

}  // namespace

// ---------------------------------------------------------------------------
// Scope

Scope::Scope(Kind kind, std::shared_ptr<const FunctionDef> def, std::shared_ptr<Scope> parent)
    : kind_(kind)
    , def_(std::move(def))
    , parent_(std::move(parent)) {}

Value* Scope::Find(const std::string& name) {
    auto it = vars_.find(name);
    return it == vars_.end() ? nullptr : &it->second;
}

void Scope::Set(const std::string& name, Value value) {
    auto it = vars_.find(name);
    if (it != vars_.end()) {
        it->second = std::move(value);
        return;
    }
    vars_.emplace(name, std::move(value));
    order_.push_back(name);
}

bool Scope::Erase(const std::string& name) {
    if (vars_.erase(name) == 0) {
        return false;
    }
    order_.erase(std::find(order_.begin(), order_.end(), name));
    return true;
}

void Scope::Clear() {
    auto released = std::move(vars_);
    vars_.clear();
    order_.clear();
}

bool Scope::MarkRetained() {
    if (retained_) {
        return false;
    }
    retained_ = true;
    return true;
}

// ---------------------------------------------------------------------------
// Interpreter

struct Interpreter::ComprehensionState {
    const Expr* expr = nullptr;
    std::shared_ptr<Scope> scope;
    std::vector<Iterator> iterators;
};

Interpreter::Interpreter(std::unordered_map<std::string, Value> builtins, InterpreterLimits limits,
                         std::shared_ptr<const CancelToken> cancel)
    : builtins_(std::move(builtins))
    , limits_(limits)
    , cancel_(std::move(cancel))
    , module_(std::make_shared<Scope>(Scope::Kind::kModule, nullptr, nullptr)) {}

Interpreter::~Interpreter() {
    handling_.clear();
    for (const auto& weak : closures_) {
        if (auto scope = weak.lock()) {
            scope->Clear();
        }
    }
    module_->Clear();
    // Whatever survives is unreachable from outside or part of a cycle.
    std::vector<std::shared_ptr<Object>> alive;
    for (const auto& weak : tracked_) {
        if (auto object = weak.lock()) {
            alive.push_back(std::move(object));
        }
    }
    tracked_.clear();
    for (const auto& object : alive) {
        object->ReleaseChildren();
    }
}

void Interpreter::Track(const std::shared_ptr<Object>& object) {
    tracked_.push_back(object);
    if (tracked_.size() >= track_prune_at_) {
        tracked_.erase(std::remove_if(tracked_.begin(), tracked_.end(),
                                      [](const std::weak_ptr<Object>& weak) { return weak.expired(); }),
                       tracked_.end());
        track_prune_at_ = std::max<std::size_t>(4096, tracked_.size() * 2);
    }
}

Value Interpreter::Adopt(const Value& value) {
    HooksScope hooks(this);
    return DeepCopy(value);
}

Value Interpreter::Export(const Value& value) {
    HooksScope hooks(this);
    return ExportAt(value, 0);
}

Value Interpreter::ExportAt(const Value& value, int depth) {
    if (depth > kMaxExportDepth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded while copying");
    }
    auto export_items = [&](const std::vector<Value>& items) {
        std::vector<Value> out;
        out.reserve(items.size());
        for (const auto& item : items) {
            out.push_back(ExportAt(item, depth + 1));
        }
        return out;
    };
    switch (value.kind()) {
        case ValueKind::kList: {
            auto items = export_items(value.AsList()->items);
            HooksScope untracked(nullptr);
            return Value::List(std::move(items));
        }
        case ValueKind::kTuple:
            return Value::Tuple(export_items(value.AsTuple()->items));
        case ValueKind::kDict: {
            std::vector<std::pair<Value, Value>> entries;
            for (const auto& [key, item] : value.AsDict()->entries) {
                entries.emplace_back(ExportAt(key, depth + 1), ExportAt(item, depth + 1));
            }
            Value copy;
            {
                HooksScope untracked(nullptr);
                copy = Value::Dict();
            }
            for (auto& [key, item] : entries) {
                copy.AsDict()->Set(key, std::move(item));
            }
            return copy;
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            auto items = export_items(value.AsSet()->items);
            Value copy;
            {
                HooksScope untracked(nullptr);
                copy = value.kind() == ValueKind::kSet ? Value::Set() : Value::FrozenSet();
            }
            for (const auto& item : items) {
                copy.AsSet()->Add(item);
            }
            return copy;
        }
        case ValueKind::kException: {
            auto exception = std::make_shared<ExceptionObject>();
            exception->type = value.AsException()->type;
            exception->args = export_items(value.AsException()->args);
            return Value::FromObject(ValueKind::kException, std::move(exception));
        }
        case ValueKind::kIterator:
        case ValueKind::kFunction:
        case ValueKind::kBoundMethod:
        case ValueKind::kClass:
        case ValueKind::kInstance: {
            auto opaque = std::make_shared<OpaqueObject>();
            opaque->type_name = TypeName(value);
            opaque->repr = Repr(value);
            return Value::FromObject(ValueKind::kOpaque, std::move(opaque));
        }
        default:
            return value;
    }
}

void Interpreter::ExecuteModule(std::shared_ptr<const Program> program) {
    HooksScope hooks(this);
    programs_.push_back(program);
    Frame frame{module_, Value::None()};
    ExecuteBlock(program->body, frame);
}

const Value* Interpreter::LookupGlobal(const std::string& name) const {
    return module_->Find(name);
}

std::vector<std::string> Interpreter::GlobalNames() const {
    return module_->names();
}

void Interpreter::CheckContainerSize(std::size_t size) const {
    if (size > limits_.max_container_size) {
        ThrowError("MemoryError", "container size limit of " + std::to_string(limits_.max_container_size) +
                                      " elements exceeded");
    }
}

void Interpreter::Tick() const {
    if (cancel_ && cancel_->cancelled()) {
        throw ExecutionCancelled();
    }
}

// ---------------------------------------------------------------------------
// Statements

Interpreter::Flow Interpreter::ExecuteBlock(const std::vector<StmtPtr>& body, Frame& frame) {
    for (const auto& stmt : body) {
        const Flow flow = ExecuteStatement(*stmt, frame);
        if (flow != Flow::kNormal) {
            return flow;
        }
    }
    return Flow::kNormal;
}

Interpreter::Flow Interpreter::ExecuteStatement(const Stmt& stmt, Frame& frame) {
    try {
        switch (stmt.kind) {
            case StmtKind::kExpr:
                Evaluate(*stmt.value, frame.scope);
                return Flow::kNormal;
            case StmtKind::kAssign: {
                const Value value = Evaluate(*stmt.value, frame.scope);
                for (const auto& target : stmt.targets) {
                    Assign(*target, value, frame.scope);
                }
                return Flow::kNormal;
            }
            case StmtKind::kAugAssign:
                ExecuteAugAssign(stmt, frame);
                return Flow::kNormal;
            case StmtKind::kReturn:
                frame.return_value = stmt.value ? Evaluate(*stmt.value, frame.scope) : Value::None();
                return Flow::kReturn;
            case StmtKind::kIf:
                if (Truthy(Evaluate(*stmt.test, frame.scope))) {
                    return ExecuteBlock(stmt.body, frame);
                }
                return ExecuteBlock(stmt.orelse, frame);
            case StmtKind::kWhile:
                return ExecuteWhile(stmt, frame);
            case StmtKind::kFor:
                return ExecuteFor(stmt, frame);
            case StmtKind::kBreak:
                return Flow::kBreak;
            case StmtKind::kContinue:
                return Flow::kContinue;
            case StmtKind::kPass:
            case StmtKind::kGlobal:
            case StmtKind::kNonlocal:
                return Flow::kNormal;
            case StmtKind::kFunctionDef:
                StoreName(stmt.function->name, MakeFunction(stmt.function, frame.scope), *frame.scope);
                return Flow::kNormal;
            case StmtKind::kClassDef:
                StoreName(stmt.class_def->name, DefineClass(*stmt.class_def, frame.scope), *frame.scope);
                return Flow::kNormal;
            case StmtKind::kTry:
                return ExecuteTry(stmt, frame);
            case StmtKind::kRaise:
                ExecuteRaise(stmt, frame);
                return Flow::kNormal;
            case StmtKind::kAssert:
                if (!Truthy(Evaluate(*stmt.test, frame.scope))) {
                    CallArguments args;
                    if (stmt.value) {
                        args.positional.push_back(Evaluate(*stmt.value, frame.scope));
                    }
                    throw ScriptException(Instantiate(FindExceptionType("AssertionError"), args));
                }
                return Flow::kNormal;
            case StmtKind::kDelete:
                for (const auto& target : stmt.targets) {
                    Delete(*target, frame.scope);
                }
                return Flow::kNormal;
            case StmtKind::kImport:
                ThrowError("ImportError", "No module named '" + (stmt.names.empty() ? "" : stmt.names.front()) + "'");
        }
    } catch (ScriptException& error) {
        if (error.line() == 0) {
            error.set_line(stmt.line);
        }
        throw;
    }
    return Flow::kNormal;
}

Interpreter::Flow Interpreter::ExecuteFor(const Stmt& stmt, Frame& frame) {
    const Value iterable = Evaluate(*stmt.value, frame.scope);
    auto next = MakeIterator(iterable);
    while (true) {
        Tick();
        auto item = next();
        if (!item) {
            break;
        }
        Assign(*stmt.target, *item, frame.scope);
        const Flow flow = ExecuteBlock(stmt.body, frame);
        if (flow == Flow::kBreak) {
            return Flow::kNormal;
        }
        if (flow == Flow::kReturn) {
            return flow;
        }
    }
    return ExecuteBlock(stmt.orelse, frame);
}

Interpreter::Flow Interpreter::ExecuteWhile(const Stmt& stmt, Frame& frame) {
    while (true) {
        Tick();
        if (!Truthy(Evaluate(*stmt.test, frame.scope))) {
            break;
        }
        const Flow flow = ExecuteBlock(stmt.body, frame);
        if (flow == Flow::kBreak) {
            return Flow::kNormal;
        }
        if (flow == Flow::kReturn) {
            return flow;
        }
    }
    return ExecuteBlock(stmt.orelse, frame);
}

Interpreter::Flow Interpreter::ExecuteTry(const Stmt& stmt, Frame& frame) {
    Flow flow = Flow::kNormal;
    try {
        std::optional<ScriptException> pending;
        try {
            flow = ExecuteBlock(stmt.body, frame);
        } catch (ScriptException& error) {
            if (stmt.handlers.empty()) {
                throw;
            }
            pending = error;
        }
        if (pending) {
            bool handled = false;
            flow = RunHandlers(stmt, frame, *pending, handled);
            if (!handled) {
                throw *pending;
            }
        } else if (flow == Flow::kNormal) {
            flow = ExecuteBlock(stmt.orelse, frame);
        }
    } catch (ScriptException&) {
        if (stmt.finalbody.empty()) {
            throw;
        }
        // A break, continue or return inside finally discards the exception.
        const Flow final_flow = ExecuteBlock(stmt.finalbody, frame);
        if (final_flow != Flow::kNormal) {
            return final_flow;
        }
        throw;
    }
    const Flow final_flow = ExecuteBlock(stmt.finalbody, frame);
    return final_flow != Flow::kNormal ? final_flow : flow;
}

Interpreter::Flow Interpreter::RunHandlers(const Stmt& stmt, Frame& frame, const ScriptException& error,
                                           bool& handled) {
    for (const auto& handler : stmt.handlers) {
        if (handler.type) {
            const Value type = Evaluate(*handler.type, frame.scope);
            if (!Matches(error.exception(), type)) {
                continue;
            }
        }
        handled = true;
        if (!handler.name.empty()) {
            StoreName(handler.name, error.exception(), *frame.scope);
        }
        handling_.push_back(error);
        PopGuard<ScriptException> guard(handling_);
        const Flow flow = ExecuteBlock(handler.body, frame);
        if (!handler.name.empty()) {
            StoreTarget(handler.name, *frame.scope).Erase(handler.name);
        }
        return flow;
    }
    return Flow::kNormal;
}

void Interpreter::ExecuteRaise(const Stmt& stmt, Frame& frame) {
    if (!stmt.value) {
        if (handling_.empty()) {
            ThrowError("RuntimeError", "No active exception to reraise");
        }
        throw handling_.back();
    }
    const Value exception = ToException(Evaluate(*stmt.value, frame.scope));
    if (stmt.cause) {
        const Value cause = Evaluate(*stmt.cause, frame.scope);
        if (!cause.IsNone()) {
            ToException(cause);
        }
    }
    throw ScriptException(exception);
}

void Interpreter::ExecuteAugAssign(const Stmt& stmt, Frame& frame) {
    const Expr& target = *stmt.target;
    const auto& scope = frame.scope;
    switch (target.kind) {
        case ExprKind::kName: {
            const Value current = LoadName(target.name, *scope);
            const Value operand = Evaluate(*stmt.value, scope);
            StoreName(target.name, InPlace(stmt.binary_op, current, operand), *scope);
            return;
        }
        case ExprKind::kSubscript: {
            const Value object = Evaluate(*target.children[0], scope);
            const Expr& index_expr = *target.children[1];
            if (index_expr.kind == ExprKind::kSlice) {
                SliceSpec slice;
                if (index_expr.children[0]) slice.start = SliceBound(Evaluate(*index_expr.children[0], scope));
                if (index_expr.children[1]) slice.stop = SliceBound(Evaluate(*index_expr.children[1], scope));
                if (index_expr.children[2]) slice.step = SliceBound(Evaluate(*index_expr.children[2], scope));
                const Value current = GetSlice(object, slice);
                const Value operand = Evaluate(*stmt.value, scope);
                SetSlice(*this, object, slice, InPlace(stmt.binary_op, current, operand));
                return;
            }
            const Value index = Evaluate(index_expr, scope);
            const Value current = GetItem(object, index);
            const Value operand = Evaluate(*stmt.value, scope);
            SetItem(*this, object, index, InPlace(stmt.binary_op, current, operand));
            return;
        }
        case ExprKind::kAttribute: {
            const Value object = Evaluate(*target.children[0], scope);
            const Value current = GetAttribute(object, target.name);
            const Value operand = Evaluate(*stmt.value, scope);
            SetAttribute(object, target.name, InPlace(stmt.binary_op, current, operand));
            return;
        }
        default:
            ThrowError("TypeError", "illegal expression for augmented assignment");
    }
}

Value Interpreter::InPlace(BinaryOperator op, const Value& lhs, const Value& rhs) {
    if (lhs.kind() == ValueKind::kInstance) {
        static const std::unordered_map<BinaryOperator, const char*> kInPlace = {
            {BinaryOperator::kAdd, "__iadd__"},      {BinaryOperator::kSub, "__isub__"},
            {BinaryOperator::kMul, "__imul__"},      {BinaryOperator::kDiv, "__itruediv__"},
            {BinaryOperator::kFloorDiv, "__ifloordiv__"}, {BinaryOperator::kMod, "__imod__"},
            {BinaryOperator::kPow, "__ipow__"},      {BinaryOperator::kLShift, "__ilshift__"},
            {BinaryOperator::kRShift, "__irshift__"}, {BinaryOperator::kBitOr, "__ior__"},
            {BinaryOperator::kBitXor, "__ixor__"},   {BinaryOperator::kBitAnd, "__iand__"},
        };
        if (auto result = CallSpecial(lhs, kInPlace.at(op), {rhs})) {
            return *result;
        }
        return BinaryOperation(*this, op, lhs, rhs);
    }
    if (lhs.kind() == ValueKind::kList && op == BinaryOperator::kAdd) {
        auto extra = Materialize(rhs);
        auto& items = lhs.AsList()->items;
        CheckContainerSize(items.size() + extra.size());
        items.insert(items.end(), std::make_move_iterator(extra.begin()), std::make_move_iterator(extra.end()));
        return lhs;
    }
    const Value result = BinaryOperation(*this, op, lhs, rhs);
    if (lhs.kind() == ValueKind::kList && op == BinaryOperator::kMul) {
        lhs.AsList()->items = result.AsList()->items;
        return lhs;
    }
    if (lhs.kind() == ValueKind::kSet && IsSetOperator(op)) {
        auto set = lhs.AsSet();
        set->Clear();
        for (const auto& item : result.AsSet()->items) {
            set->Add(item);
        }
        return lhs;
    }
    if (lhs.kind() == ValueKind::kDict && op == BinaryOperator::kBitOr) {
        auto dict = lhs.AsDict();
        for (const auto& entry : result.AsDict()->entries) {
            dict->Set(entry.first, entry.second);
        }
        return lhs;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Names

Value Interpreter::LoadName(const std::string& name, Scope& scope) {
    bool innermost_function = true;
    for (Scope* current = &scope; current != nullptr; current = current->parent().get()) {
        switch (current->kind()) {
            case Scope::Kind::kComprehension:
                if (const Value* value = current->Find(name)) {
                    return *value;
                }
                break;
            case Scope::Kind::kFunction: {
                const FunctionDef* def = current->def();
                if (def->global_names.count(name) > 0) {
                    return LoadGlobal(name);
                }
                if (def->local_names.count(name) > 0) {
                    if (const Value* value = current->Find(name)) {
                        return *value;
                    }
                    if (innermost_function) {
                        ThrowError("UnboundLocalError", "local variable '" + name + "' referenced before assignment");
                    }
                    ThrowError("NameError", "cannot access free variable '" + name +
                                                "' where it is not associated with a value in enclosing scope");
                }
                innermost_function = false;
                break;
            }
            case Scope::Kind::kClass:
                // Only code directly in the class body sees its names.
                if (current == &scope) {
                    if (const Value* value = current->Find(name)) {
                        return *value;
                    }
                }
                innermost_function = false;
                break;
            case Scope::Kind::kModule:
                return LoadGlobal(name);
        }
    }
    return LoadGlobal(name);
}

Value Interpreter::LoadGlobal(const std::string& name) {
    if (const Value* value = module_->Find(name)) {
        return *value;
    }
    const auto it = builtins_.find(name);
    if (it != builtins_.end()) {
        return it->second;
    }
    ThrowError("NameError", "name '" + name + "' is not defined");
}

Scope& Interpreter::StoreTarget(const std::string& name, Scope& scope) {
    if (scope.kind() != Scope::Kind::kFunction) {
        return scope;
    }
    const FunctionDef* def = scope.def();
    if (def->global_names.count(name) > 0) {
        return *module_;
    }
    if (def->nonlocal_names.count(name) > 0) {
        for (Scope* current = scope.parent().get(); current != nullptr; current = current->parent().get()) {
            if (current->kind() == Scope::Kind::kFunction && current->def()->local_names.count(name) > 0) {
                return *current;
            }
        }
        ThrowError("NameError", "no binding for nonlocal '" + name + "' found");
    }
    return scope;
}

void Interpreter::StoreName(const std::string& name, Value value, Scope& scope) {
    StoreTarget(name, scope).Set(name, std::move(value));
}

void Interpreter::DeleteName(const std::string& name, Scope& scope) {
    Scope& target = StoreTarget(name, scope);
    if (target.Erase(name)) {
        return;
    }
    if (target.kind() == Scope::Kind::kFunction) {
        ThrowError("UnboundLocalError", "local variable '" + name + "' referenced before assignment");
    }
    ThrowError("NameError", "name '" + name + "' is not defined");
}

void Interpreter::Assign(const Expr& target, const Value& value, const std::shared_ptr<Scope>& scope) {
    switch (target.kind) {
        case ExprKind::kName:
            StoreName(target.name, value, *scope);
            return;
        case ExprKind::kSubscript: {
            const Value object = Evaluate(*target.children[0], scope);
            const Expr& index_expr = *target.children[1];
            if (index_expr.kind == ExprKind::kSlice) {
                SliceSpec slice;
                if (index_expr.children[0]) slice.start = SliceBound(Evaluate(*index_expr.children[0], scope));
                if (index_expr.children[1]) slice.stop = SliceBound(Evaluate(*index_expr.children[1], scope));
                if (index_expr.children[2]) slice.step = SliceBound(Evaluate(*index_expr.children[2], scope));
                SetSlice(*this, object, slice, value);
                return;
            }
            SetItem(*this, object, Evaluate(index_expr, scope), value);
            return;
        }
        case ExprKind::kAttribute:
            SetAttribute(Evaluate(*target.children[0], scope), target.name, value);
            return;
        case ExprKind::kTuple:
        case ExprKind::kList: {
            if (!IsIterable(value)) {
                ThrowError("TypeError", "cannot unpack non-iterable " + TypeName(value) + " object");
            }
            const auto items = Materialize(value);
            const auto& targets = target.children;
            std::size_t starred = targets.size();
            for (std::size_t i = 0; i < targets.size(); ++i) {
                if (targets[i]->kind == ExprKind::kStarred) {
                    starred = i;
                }
            }
            if (starred == targets.size()) {
                if (items.size() < targets.size()) {
                    ThrowError("ValueError", "not enough values to unpack (expected " +
                                                 std::to_string(targets.size()) + ", got " +
                                                 std::to_string(items.size()) + ")");
                }
                if (items.size() > targets.size()) {
                    ThrowError("ValueError", "too many values to unpack (expected " +
                                                 std::to_string(targets.size()) + ")");
                }
                for (std::size_t i = 0; i < targets.size(); ++i) {
                    Assign(*targets[i], items[i], scope);
                }
                return;
            }
            const std::size_t required = targets.size() - 1;
            if (items.size() < required) {
                ThrowError("ValueError", "not enough values to unpack (expected at least " + std::to_string(required) +
                                             ", got " + std::to_string(items.size()) + ")");
            }
            const std::size_t after = targets.size() - starred - 1;
            for (std::size_t i = 0; i < starred; ++i) {
                Assign(*targets[i], items[i], scope);
            }
            std::vector<Value> middle(items.begin() + static_cast<std::ptrdiff_t>(starred),
                                      items.end() - static_cast<std::ptrdiff_t>(after));
            Assign(*targets[starred]->children[0], Value::List(std::move(middle)), scope);
            for (std::size_t i = 0; i < after; ++i) {
                Assign(*targets[starred + 1 + i], items[items.size() - after + i], scope);
            }
            return;
        }
        default:
            ThrowError("TypeError", "cannot assign to expression");
    }
}

void Interpreter::Delete(const Expr& target, const std::shared_ptr<Scope>& scope) {
    switch (target.kind) {
        case ExprKind::kName:
            DeleteName(target.name, *scope);
            return;
        case ExprKind::kSubscript: {
            const Value object = Evaluate(*target.children[0], scope);
            const Expr& index_expr = *target.children[1];
            if (index_expr.kind == ExprKind::kSlice) {
                SliceSpec slice;
                if (index_expr.children[0]) slice.start = SliceBound(Evaluate(*index_expr.children[0], scope));
                if (index_expr.children[1]) slice.stop = SliceBound(Evaluate(*index_expr.children[1], scope));
                if (index_expr.children[2]) slice.step = SliceBound(Evaluate(*index_expr.children[2], scope));
                DeleteSlice(object, slice);
                return;
            }
            DeleteItem(object, Evaluate(index_expr, scope));
            return;
        }
        case ExprKind::kTuple:
        case ExprKind::kList:
            for (const auto& child : target.children) {
                Delete(*child, scope);
            }
            return;
        case ExprKind::kAttribute:
            DeleteAttribute(Evaluate(*target.children[0], scope), target.name);
            return;
        default:
            ThrowError("TypeError", "cannot delete expression");
    }
}

void Interpreter::SetAttribute(const Value& object, const std::string& name, Value value) {
    if (object.kind() == ValueKind::kInstance) {
        object.AsInstance()->attributes[name] = std::move(value);
        return;
    }
    if (object.kind() == ValueKind::kClass) {
        object.AsClass()->attributes[name] = std::move(value);
        return;
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

void Interpreter::DeleteAttribute(const Value& object, const std::string& name) {
    if (object.kind() == ValueKind::kInstance) {
        if (object.AsInstance()->attributes.erase(name) == 0) {
            ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
        }
        return;
    }
    if (object.kind() == ValueKind::kClass) {
        const auto cls = object.AsClass();
        if (cls->attributes.erase(name) == 0) {
            ThrowError("AttributeError", "type object '" + cls->name + "' has no attribute '" + name + "'");
        }
        return;
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

// ---------------------------------------------------------------------------
// Expressions

Value Interpreter::Evaluate(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    switch (expr.kind) {
        case ExprKind::kName:
            return LoadName(expr.name, *scope);
        case ExprKind::kConstant:
            return expr.constant;
        case ExprKind::kFString:
            return EvaluateFString(expr, scope);
        case ExprKind::kList: {
            auto items = EvaluateElements(expr.children, scope);
            CheckContainerSize(items.size());
            return Value::List(std::move(items));
        }
        case ExprKind::kTuple: {
            auto items = EvaluateElements(expr.children, scope);
            CheckContainerSize(items.size());
            return Value::Tuple(std::move(items));
        }
        case ExprKind::kSet: {
            auto result = Value::Set();
            for (const auto& item : EvaluateElements(expr.children, scope)) {
                result.AsSet()->Add(item);
            }
            return result;
        }
        case ExprKind::kDict: {
            auto result = Value::Dict();
            auto dict = result.AsDict();
            for (std::size_t i = 0; i + 1 < expr.children.size(); i += 2) {
                Value key = Evaluate(*expr.children[i], scope);
                Value value = Evaluate(*expr.children[i + 1], scope);
                dict->Set(key, std::move(value));
            }
            return result;
        }
        case ExprKind::kListComp:
        case ExprKind::kSetComp:
        case ExprKind::kDictComp:
        case ExprKind::kGenerator:
            return EvaluateComprehension(expr, scope);
        case ExprKind::kUnaryOp: {
            const Value operand = Evaluate(*expr.children[0], scope);
            if (expr.unary_op == UnaryOperator::kNot) {
                return Value::Bool(!Truthy(operand));
            }
            return UnaryOperation(expr.unary_op, operand);
        }
        case ExprKind::kBinaryOp: {
            const Value lhs = Evaluate(*expr.children[0], scope);
            const Value rhs = Evaluate(*expr.children[1], scope);
            return BinaryOperation(*this, expr.binary_op, lhs, rhs);
        }
        case ExprKind::kBoolOp: {
            Value result;
            for (const auto& operand : expr.children) {
                result = Evaluate(*operand, scope);
                if (Truthy(result) != expr.is_and) {
                    return result;
                }
            }
            return result;
        }
        case ExprKind::kCompare: {
            Value lhs = Evaluate(*expr.children[0], scope);
            for (std::size_t i = 0; i < expr.compare_ops.size(); ++i) {
                Value rhs = Evaluate(*expr.children[i + 1], scope);
                if (!CompareOperation(*this, expr.compare_ops[i], lhs, rhs)) {
                    return Value::Bool(false);
                }
                lhs = std::move(rhs);
            }
            return Value::Bool(true);
        }
        case ExprKind::kIfExp:
            return Truthy(Evaluate(*expr.children[0], scope)) ? Evaluate(*expr.children[1], scope)
                                                               : Evaluate(*expr.children[2], scope);
        case ExprKind::kLambda:
            return MakeFunction(expr.function, scope);
        case ExprKind::kCall:
            return EvaluateCall(expr, scope);
        case ExprKind::kAttribute:
            return GetAttribute(Evaluate(*expr.children[0], scope), expr.name);
        case ExprKind::kSubscript:
            return EvaluateSubscript(expr, scope);
        case ExprKind::kSlice:
            ThrowError("TypeError", "slice objects are not supported here");
        case ExprKind::kStarred:
            ThrowError("TypeError", "can't use starred expression here");
    }
    return Value::None();
}

std::vector<Value> Interpreter::EvaluateElements(const std::vector<ExprPtr>& elements,
                                                 const std::shared_ptr<Scope>& scope) {
    std::vector<Value> items;
    items.reserve(elements.size());
    for (const auto& element : elements) {
        if (element->kind == ExprKind::kStarred) {
            auto expanded = Materialize(Evaluate(*element->children[0], scope));
            CheckContainerSize(items.size() + expanded.size());
            items.insert(items.end(), std::make_move_iterator(expanded.begin()),
                         std::make_move_iterator(expanded.end()));
        } else {
            items.push_back(Evaluate(*element, scope));
        }
    }
    return items;
}

Value Interpreter::EvaluateCall(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const Value callee = Evaluate(*expr.children[0], scope);
    CallArguments args;
    for (std::size_t i = 1; i < expr.children.size(); ++i) {
        const Expr& argument = *expr.children[i];
        if (argument.kind == ExprKind::kStarred) {
            auto expanded = Materialize(Evaluate(*argument.children[0], scope));
            args.positional.insert(args.positional.end(), std::make_move_iterator(expanded.begin()),
                                   std::make_move_iterator(expanded.end()));
        } else {
            args.positional.push_back(Evaluate(argument, scope));
        }
    }
    for (const auto& keyword : expr.keywords) {
        args.keywords.emplace_back(keyword.name, Evaluate(*keyword.value, scope));
    }
    return Call(callee, std::move(args));
}

Value Interpreter::EvaluateFString(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    std::string out;
    for (const auto& part : expr.fstring_parts) {
        out += part.literal;
        if (!part.expr) {
            continue;
        }
        Value value = Evaluate(*part.expr, scope);
        if (part.conversion == 'r') {
            value = Value::Str(Repr(value));
        } else if (part.conversion == 's') {
            value = Value::Str(Str(value));
        }
        out += FormatValue(value, part.format_spec);
        CheckContainerSize(out.size());
    }
    return Value::Str(std::move(out));
}

Value Interpreter::EvaluateSubscript(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    const Value object = Evaluate(*expr.children[0], scope);
    const Expr& index_expr = *expr.children[1];
    if (index_expr.kind == ExprKind::kSlice) {
        SliceSpec slice;
        if (index_expr.children[0]) slice.start = SliceBound(Evaluate(*index_expr.children[0], scope));
        if (index_expr.children[1]) slice.stop = SliceBound(Evaluate(*index_expr.children[1], scope));
        if (index_expr.children[2]) slice.step = SliceBound(Evaluate(*index_expr.children[2], scope));
        return GetSlice(object, slice);
    }
    return GetItem(object, Evaluate(index_expr, scope));
}

std::shared_ptr<Interpreter::ComprehensionState> Interpreter::StartComprehension(
    const Expr& expr, const std::shared_ptr<Scope>& scope) {
    // The outermost iterable is evaluated in the enclosing scope.
    const Value first = Evaluate(*expr.generators.front().iter, scope);
    auto state = std::make_shared<ComprehensionState>();
    state->expr = &expr;
    state->scope = std::make_shared<Scope>(Scope::Kind::kComprehension, nullptr, scope);
    state->iterators.push_back(MakeIterator(first));
    return state;
}

bool Interpreter::AdvanceComprehension(ComprehensionState& state) {
    const auto& clauses = state.expr->generators;
    while (!state.iterators.empty()) {
        Tick();
        const std::size_t level = state.iterators.size() - 1;
        auto item = state.iterators.back()();
        if (!item) {
            state.iterators.pop_back();
            continue;
        }
        const auto& clause = clauses[level];
        Assign(*clause.target, *item, state.scope);
        bool accepted = true;
        for (const auto& condition : clause.conditions) {
            if (!Truthy(Evaluate(*condition, state.scope))) {
                accepted = false;
                break;
            }
        }
        if (!accepted) {
            continue;
        }
        if (level + 1 < clauses.size()) {
            state.iterators.push_back(MakeIterator(Evaluate(*clauses[level + 1].iter, state.scope)));
            continue;
        }
        return true;
    }
    return false;
}

Value Interpreter::EvaluateComprehension(const Expr& expr, const std::shared_ptr<Scope>& scope) {
    auto state = StartComprehension(expr, scope);
    switch (expr.kind) {
        case ExprKind::kListComp: {
            std::vector<Value> items;
            while (AdvanceComprehension(*state)) {
                items.push_back(Evaluate(*expr.children[0], state->scope));
                CheckContainerSize(items.size());
            }
            return Value::List(std::move(items));
        }
        case ExprKind::kSetComp: {
            auto result = Value::Set();
            while (AdvanceComprehension(*state)) {
                result.AsSet()->Add(Evaluate(*expr.children[0], state->scope));
                CheckContainerSize(result.AsSet()->size());
            }
            return result;
        }
        case ExprKind::kDictComp: {
            auto result = Value::Dict();
            while (AdvanceComprehension(*state)) {
                Value key = Evaluate(*expr.children[0], state->scope);
                Value value = Evaluate(*expr.children[1], state->scope);
                result.AsDict()->Set(key, std::move(value));
                CheckContainerSize(result.AsDict()->size());
            }
            return result;
        }
        default: {
            // Generator expressions run lazily; the iterator keeps its scope alive.
            Retain(scope);
            auto iterator = std::make_shared<IteratorObject>();
            iterator->type_name = "generator";
            iterator->next = [this, state]() -> std::optional<Value> {
                if (!AdvanceComprehension(*state)) {
                    return std::nullopt;
                }
                return Evaluate(*state->expr->children[0], state->scope);
            };
            return Value::FromObject(ValueKind::kIterator, std::move(iterator));
        }
    }
}

Value Interpreter::MakeFunction(const std::shared_ptr<FunctionDef>& def, const std::shared_ptr<Scope>& scope) {
    auto function = std::make_shared<FunctionObject>();
    function->def = def;
    for (const auto& default_expr : def->defaults) {
        function->defaults.push_back(Evaluate(*default_expr, scope));
    }
    // Methods do not close over the class body.
    auto closure = scope;
    while (closure->kind() == Scope::Kind::kClass) {
        closure = closure->parent();
    }
    function->closure = closure;
    Retain(closure);
    Track(function);
    return Value::FromObject(ValueKind::kFunction, std::move(function));
}

Value Interpreter::DefineClass(const ClassDef& def, const std::shared_ptr<Scope>& scope) {
    std::vector<Value> bases;
    for (const auto& base : def.bases) {
        bases.push_back(Evaluate(*base, scope));
    }
    if (!bases.empty() && bases.front().kind() == ValueKind::kExceptionType) {
        if (bases.size() > 1) {
            ThrowError("TypeError", "an exception class may only have a single base");
        }
        return DefineExceptionClass(def, bases.front().AsExceptionType());
    }

    auto cls = std::make_shared<ClassObject>();
    cls->name = def.name;
    for (const auto& base : bases) {
        if (base.kind() != ValueKind::kClass) {
            if (base.kind() == ValueKind::kBuiltin && !base.AsBuiltin()->constructs.empty()) {
                ThrowError("TypeError", "subclassing built-in type '" + base.AsBuiltin()->constructs +
                                            "' is not supported");
            }
            if (base.kind() == ValueKind::kExceptionType) {
                ThrowError("TypeError", "an exception class may only have a single base");
            }
            ThrowError("TypeError", "bases must be classes, not '" + TypeName(base) + "'");
        }
        const auto base_class = base.AsClass();
        if (std::find(cls->bases.begin(), cls->bases.end(), base_class) != cls->bases.end()) {
            ThrowError("TypeError", "duplicate base class " + base_class->name);
        }
        cls->bases.push_back(base_class);
    }
    cls->ancestors = Linearize(*cls);

    auto body = std::make_shared<Scope>(Scope::Kind::kClass, nullptr, scope);
    Frame frame{body, Value::None()};
    ExecuteBlock(def.body, frame);
    for (const auto& name : body->names()) {
        cls->attributes[name] = *body->Find(name);
    }
    body->Clear();
    Track(cls);
    return Value::FromObject(ValueKind::kClass, std::move(cls));
}

Value Interpreter::DefineExceptionClass(const ClassDef& def, const std::shared_ptr<const ExceptionType>& base) {
    for (const auto& stmt : def.body) {
        if (stmt->kind != StmtKind::kPass && !IsDocstring(*stmt)) {
            ThrowError("TypeError", "exception class '" + def.name +
                                        "' may only contain 'pass' or a docstring");
        }
    }
    auto type = std::make_shared<ExceptionType>();
    type->name = def.name;
    type->base = base;
    return Value::FromExceptionType(std::move(type));
}

void Interpreter::Retain(const std::shared_ptr<Scope>& scope) {
    for (auto current = scope; current && current->kind() != Scope::Kind::kModule; current = current->parent()) {
        if (!current->MarkRetained()) {
            break;
        }
        closures_.push_back(current);
    }
    if (closures_.size() >= prune_at_) {
        closures_.erase(std::remove_if(closures_.begin(), closures_.end(),
                                       [](const std::weak_ptr<Scope>& weak) { return weak.expired(); }),
                        closures_.end());
        prune_at_ = std::max<std::size_t>(1024, closures_.size() * 2);
    }
}

// ---------------------------------------------------------------------------
// Calls

Value Interpreter::Call(const Value& callee, std::vector<Value> positional) {
    CallArguments args;
    args.positional = std::move(positional);
    return Call(callee, std::move(args));
}

Value Interpreter::Call(const Value& callee, CallArguments args) {
    Tick();
    HooksScope hooks(this);
    switch (callee.kind()) {
        case ValueKind::kFunction:
            return CallFunction(*callee.AsFunction(), args);
        case ValueKind::kBuiltin:
            return callee.AsBuiltin()->fn(*this, args);
        case ValueKind::kBoundMethod: {
            const auto method = callee.AsBoundMethod();
            if (!method->function.IsNone()) {
                args.positional.insert(args.positional.begin(), method->self);
                return Call(method->function, std::move(args));
            }
            return CallMethod(*this, method->self, method->name, args);
        }
        case ValueKind::kExceptionType:
            return Instantiate(callee.AsExceptionType(), args);
        case ValueKind::kClass:
            return Construct(callee.AsClass(), args);
        case ValueKind::kInstance:
            if (const Value* method = callee.AsInstance()->cls->Lookup("__call__")) {
                const Value function = *method;
                args.positional.insert(args.positional.begin(), callee);
                return Call(function, std::move(args));
            }
            ThrowError("TypeError", "'" + TypeName(callee) + "' object is not callable");
        default:
            ThrowError("TypeError", "'" + TypeName(callee) + "' object is not callable");
    }
}

std::optional<Value> Interpreter::CallSpecial(const Value& self, const std::string& name, std::vector<Value> args) {
    if (self.kind() != ValueKind::kInstance) {
        return std::nullopt;
    }
    const Value* method = self.AsInstance()->cls->Lookup(name);
    if (method == nullptr) {
        return std::nullopt;
    }
    const Value function = *method;
    CallArguments call;
    call.positional.reserve(args.size() + 1);
    call.positional.push_back(self);
    for (auto& arg : args) {
        call.positional.push_back(std::move(arg));
    }
    return Call(function, std::move(call));
}

Value Interpreter::Construct(const std::shared_ptr<ClassObject>& cls, CallArguments& args) {
    auto instance = std::make_shared<InstanceObject>();
    instance->cls = cls;
    Track(instance);
    const Value self = Value::FromObject(ValueKind::kInstance, std::move(instance));
    const Value* init = cls->Lookup("__init__");
    if (init == nullptr) {
        if (!args.positional.empty() || !args.keywords.empty()) {
            ThrowError("TypeError", cls->name + "() takes no arguments");
        }
        return self;
    }
    const Value initializer = *init;
    args.positional.insert(args.positional.begin(), self);
    const Value result = Call(initializer, std::move(args));
    if (!result.IsNone()) {
        ThrowError("TypeError", "__init__() should return None, not '" + TypeName(result) + "'");
    }
    return self;
}

Value Interpreter::CallFunction(const FunctionObject& function, CallArguments& args) {
    if (depth_ >= limits_.max_call_depth) {
        ThrowError("RecursionError", "maximum recursion depth exceeded");
    }
    DepthGuard guard(depth_);
    auto locals = std::make_shared<Scope>(Scope::Kind::kFunction, function.def, function.closure);
    BindArguments(function, args, *locals);
    Frame frame{locals, Value::None()};
    if (ExecuteBlock(function.def->body, frame) == Flow::kReturn) {
        return frame.return_value;
    }
    return Value::None();
}

void Interpreter::BindArguments(const FunctionObject& function, CallArguments& args, Scope& locals) {
    const FunctionDef& def = *function.def;
    const std::string name = DisplayName(def);
    const std::size_t count = def.params.size();
    const std::size_t given = args.positional.size();
    const std::size_t required = count - function.defaults.size();

    if (given > count && def.vararg.empty()) {
        const std::string takes = function.defaults.empty()
            ? std::to_string(count)
            : "from " + std::to_string(required) + " to " + std::to_string(count);
        ThrowError("TypeError", name + "() takes " + takes + " positional argument" + (takes == "1" ? "" : "s") +
                                    " but " + std::to_string(given) + (given == 1 ? " was" : " were") + " given");
    }

    std::vector<bool> bound(count, false);
    const std::size_t direct = std::min(count, given);
    for (std::size_t i = 0; i < direct; ++i) {
        locals.Set(def.params[i], args.positional[i]);
        bound[i] = true;
    }
    if (!def.vararg.empty()) {
        std::vector<Value> extra;
        if (given > count) {
            extra.assign(args.positional.begin() + static_cast<std::ptrdiff_t>(count), args.positional.end());
        }
        locals.Set(def.vararg, Value::Tuple(std::move(extra)));
    }

    for (auto& [keyword, value] : args.keywords) {
        const auto it = std::find(def.params.begin(), def.params.end(), keyword);
        if (it == def.params.end()) {
            ThrowError("TypeError", name + "() got an unexpected keyword argument '" + keyword + "'");
        }
        const auto position = static_cast<std::size_t>(it - def.params.begin());
        if (bound[position]) {
            ThrowError("TypeError", name + "() got multiple values for argument '" + keyword + "'");
        }
        locals.Set(keyword, std::move(value));
        bound[position] = true;
    }

    std::vector<std::string> missing;
    for (std::size_t i = 0; i < count; ++i) {
        if (bound[i]) {
            continue;
        }
        if (i >= required) {
            locals.Set(def.params[i], function.defaults[i - required]);
        } else {
            missing.push_back(def.params[i]);
        }
    }
    if (!missing.empty()) {
        ThrowError("TypeError", name + "() missing " + std::to_string(missing.size()) + " required positional argument" +
                                    (missing.size() == 1 ? "" : "s") + ": " + QuoteList(missing));
    }
}

Value Interpreter::Instantiate(const std::shared_ptr<const ExceptionType>& type, CallArguments& args) {
    if (!args.keywords.empty()) {
        ThrowError("TypeError", type->name + "() takes no keyword arguments");
    }
    auto exception = std::make_shared<ExceptionObject>();
    exception->type = type;
    exception->args = std::move(args.positional);
    return Value::FromObject(ValueKind::kException, std::move(exception));
}

Value Interpreter::ToException(const Value& value) {
    if (value.kind() == ValueKind::kException) {
        return value;
    }
    if (value.kind() == ValueKind::kExceptionType) {
        CallArguments args;
        return Instantiate(value.AsExceptionType(), args);
    }
    ThrowError("TypeError", "exceptions must derive from BaseException");
}

bool Interpreter::Matches(const Value& exception, const Value& handler_type) {
    if (handler_type.kind() == ValueKind::kExceptionType) {
        return exception.AsException()->type->IsSubclassOf(*handler_type.AsExceptionType());
    }
    if (handler_type.kind() == ValueKind::kTuple) {
        bool matched = false;
        for (const auto& element : handler_type.AsTuple()->items) {
            matched = Matches(exception, element) || matched;
        }
        return matched;
    }
    ThrowError("TypeError", "catching classes that do not inherit from BaseException is not allowed");
}

// ---------------------------------------------------------------------------
// Attributes and iteration

Value Interpreter::GetAttribute(const Value& object, const std::string& name) {
    if (object.kind() == ValueKind::kException && name == "args") {
        return Value::Tuple(object.AsException()->args);
    }
    if (object.kind() == ValueKind::kInstance) {
        const auto instance = object.AsInstance();
        const auto it = instance->attributes.find(name);
        if (it != instance->attributes.end()) {
            return it->second;
        }
        const Value* attribute = instance->cls->Lookup(name);
        if (attribute == nullptr) {
            ThrowError("AttributeError", "'" + instance->cls->name + "' object has no attribute '" + name + "'");
        }
        if (attribute->kind() != ValueKind::kFunction) {
            return *attribute;
        }
        auto method = std::make_shared<BoundMethod>();
        method->self = object;
        method->name = name;
        method->function = *attribute;
        return Value::FromObject(ValueKind::kBoundMethod, std::move(method));
    }
    if (object.kind() == ValueKind::kClass) {
        const auto cls = object.AsClass();
        if (const Value* attribute = cls->Lookup(name)) {
            return *attribute;
        }
        ThrowError("AttributeError", "type object '" + cls->name + "' has no attribute '" + name + "'");
    }
    if (object.kind() == ValueKind::kSlice && (name == "start" || name == "stop" || name == "step")) {
        const auto slice = object.AsSlice();
        return name == "start" ? slice->start : (name == "stop" ? slice->stop : slice->step);
    }
    if (HasMethod(object, name)) {
        auto method = std::make_shared<BoundMethod>();
        method->self = object;
        method->name = name;
        return Value::FromObject(ValueKind::kBoundMethod, std::move(method));
    }
    if (object.kind() == ValueKind::kExceptionType) {
        ThrowError("AttributeError",
                   "type object '" + object.AsExceptionType()->name + "' has no attribute '" + name + "'");
    }
    ThrowError("AttributeError", "'" + TypeName(object) + "' object has no attribute '" + name + "'");
}

Iterator Interpreter::MakeIterator(const Value& iterable) {
    switch (iterable.kind()) {
        case ValueKind::kList: {
            auto list = iterable.AsList();
            return [list, position = std::size_t{0}]() mutable -> std::optional<Value> {
                if (position < list->items.size()) {
                    return list->items[position++];
                }
                position = kExhausted;
                return std::nullopt;
            };
        }
        case ValueKind::kTuple: {
            auto tuple = iterable.AsTuple();
            return [tuple, position = std::size_t{0}]() mutable -> std::optional<Value> {
                if (position < tuple->items.size()) {
                    return tuple->items[position++];
                }
                return std::nullopt;
            };
        }
        case ValueKind::kStr: {
            auto chars = std::make_shared<const std::u32string>(DecodeUtf8(iterable.AsStr()));
            return [chars, position = std::size_t{0}]() mutable -> std::optional<Value> {
                if (position < chars->size()) {
                    return Value::Str(EncodeUtf8((*chars)[position++]));
                }
                return std::nullopt;
            };
        }
        case ValueKind::kRange: {
            auto range = iterable.AsRange();
            return [range, position = std::uint64_t{0}]() mutable -> std::optional<Value> {
                if (position < range->Count()) {
                    return Value::Int(range->At(position++));
                }
                return std::nullopt;
            };
        }
        case ValueKind::kDict: {
            auto dict = iterable.AsDict();
            return [dict, expected = dict->size(), position = std::size_t{0}]() mutable -> std::optional<Value> {
                if (position == kExhausted) {
                    return std::nullopt;
                }
                if (dict->size() != expected) {
                    position = kExhausted;
                    ThrowError("RuntimeError", "dictionary changed size during iteration");
                }
                if (position < dict->entries.size()) {
                    return dict->entries[position++].first;
                }
                position = kExhausted;
                return std::nullopt;
            };
        }
        case ValueKind::kInstance: {
            auto iterator = CallSpecial(iterable, "__iter__", {});
            if (!iterator) {
                ThrowError("TypeError", "'" + TypeName(iterable) + "' object is not iterable");
            }
            if (iterator->kind() != ValueKind::kInstance) {
                return MakeIterator(*iterator);
            }
            if (iterator->AsInstance()->cls->Lookup("__next__") == nullptr) {
                ThrowError("TypeError", "iter() returned non-iterator of type '" + TypeName(*iterator) + "'");
            }
            return [this, source = *iterator, done = false]() mutable -> std::optional<Value> {
                if (done) {
                    return std::nullopt;
                }
                try {
                    return CallSpecial(source, "__next__", {});
                } catch (const ScriptException& error) {
                    if (!IsStopIteration(error)) {
                        throw;
                    }
                    done = true;
                    return std::nullopt;
                }
            };
        }
        case ValueKind::kSet:
        case ValueKind::kFrozenSet: {
            auto set = iterable.AsSet();
            return [set, expected = set->size(), position = std::size_t{0}]() mutable -> std::optional<Value> {
                if (position == kExhausted) {
                    return std::nullopt;
                }
                if (set->size() != expected) {
                    position = kExhausted;
                    ThrowError("RuntimeError", "Set changed size during iteration");
                }
                if (position < set->items.size()) {
                    return set->items[position++];
                }
                position = kExhausted;
                return std::nullopt;
            };
        }
        case ValueKind::kIterator: {
            auto iterator = iterable.AsIterator();
            if (iterator->is_view) {
                auto snapshot = std::make_shared<const std::vector<Value>>(iterator->snapshot);
                return [snapshot, position = std::size_t{0}]() mutable -> std::optional<Value> {
                    if (position < snapshot->size()) {
                        return (*snapshot)[position++];
                    }
                    return std::nullopt;
                };
            }
            return [iterator]() { return iterator->next(); };
        }
        default:
            ThrowError("TypeError", "'" + TypeName(iterable) + "' object is not iterable");
    }
}

std::vector<Value> Interpreter::Materialize(const Value& iterable) {
    if (iterable.kind() == ValueKind::kList) {
        return iterable.AsList()->items;
    }
    if (iterable.kind() == ValueKind::kTuple) {
        return iterable.AsTuple()->items;
    }
    std::vector<Value> items;
    if (iterable.kind() == ValueKind::kRange) {
        const auto length = iterable.AsRange()->Count();
        CheckContainerSize(static_cast<std::size_t>(length));
        items.reserve(static_cast<std::size_t>(length));
    }
    auto next = MakeIterator(iterable);
    while (auto item = next()) {
        Tick();
        items.push_back(std::move(*item));
        CheckContainerSize(items.size());
    }
    return items;
}

}  // namespace evalbox::lang
