#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "lang/ast.hpp"
#include "lang/script_error.hpp"
#include "lang/value.hpp"

namespace evalbox::lang {

// Set by the runner when a deadline expires; the interpreter checks it at
// every loop iteration and call.
class CancelToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

struct InterpreterLimits {
    int max_call_depth = 200;
    std::size_t max_container_size = 10000000;
};

class Scope {
public:
    enum class Kind { kModule, kFunction, kComprehension, kClass };

    Scope(Kind kind, std::shared_ptr<const FunctionDef> def, std::shared_ptr<Scope> parent);

    Kind kind() const { return kind_; }
    const FunctionDef* def() const { return def_.get(); }
    const std::shared_ptr<Scope>& parent() const { return parent_; }

    Value* Find(const std::string& name);
    void Set(const std::string& name, Value value);
    bool Erase(const std::string& name);
    void Clear();
    // Bound names in first-assignment order.
    const std::vector<std::string>& names() const { return order_; }
    // False when the scope was already registered for cleanup.
    bool MarkRetained();

private:
    Kind kind_;
    std::shared_ptr<const FunctionDef> def_;
    std::shared_ptr<Scope> parent_;
    std::unordered_map<std::string, Value> vars_;
    std::vector<std::string> order_;
    bool retained_ = false;
};

using Iterator = std::function<std::optional<Value>()>;

// Tree-walking evaluator for a parsed Program. One instance holds one
// submission's module globals; it is not thread safe. While it runs it is the
// thread's ExecutionHooks: it tracks every container it creates and clears
// them on destruction, so reference cycles do not outlive it.
class Interpreter : public ExecutionHooks {
public:
    Interpreter(std::unordered_map<std::string, Value> builtins, InterpreterLimits limits = {},
                std::shared_ptr<const CancelToken> cancel = nullptr);
    ~Interpreter() override;

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Runs the top-level statements. Throws ScriptException for submission
    // errors and ExecutionCancelled when the token fires.
    void ExecuteModule(std::shared_ptr<const Program> program);

    Value Call(const Value& callee, CallArguments args);
    Value Call(const Value& callee, std::vector<Value> positional);

    // Deep copy of a host value into containers this interpreter owns.
    Value Adopt(const Value& value);
    // Copy of a result that stays valid after the interpreter is destroyed.
    // Instances, classes and functions become opaque stand-ins carrying their
    // repr. Raises RecursionError past 500 levels of nesting.
    Value Export(const Value& value);

    void Track(const std::shared_ptr<Object>& object) override;
    std::optional<Value> CallSpecial(const Value& self, const std::string& name,
                                     std::vector<Value> args) override;

    const Value* LookupGlobal(const std::string& name) const;
    std::vector<std::string> GlobalNames() const;

    Value GetAttribute(const Value& object, const std::string& name);
    Iterator MakeIterator(const Value& iterable);
    std::vector<Value> Materialize(const Value& iterable);

    // Raises MemoryError past the container limit.
    void CheckContainerSize(std::size_t size) const;
    // Throws ExecutionCancelled once the token has fired.
    void Tick() const;

    const InterpreterLimits& limits() const { return limits_; }

private:
    enum class Flow { kNormal, kBreak, kContinue, kReturn };

    struct Frame {
        std::shared_ptr<Scope> scope;
        Value return_value;
    };

    struct ComprehensionState;

    Flow ExecuteBlock(const std::vector<StmtPtr>& body, Frame& frame);
    Flow ExecuteStatement(const Stmt& stmt, Frame& frame);
    Flow ExecuteFor(const Stmt& stmt, Frame& frame);
    Flow ExecuteWhile(const Stmt& stmt, Frame& frame);
    Flow ExecuteTry(const Stmt& stmt, Frame& frame);
    Flow RunHandlers(const Stmt& stmt, Frame& frame, const ScriptException& error, bool& handled);
    void ExecuteRaise(const Stmt& stmt, Frame& frame);
    void ExecuteAugAssign(const Stmt& stmt, Frame& frame);

    Value Evaluate(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value EvaluateCall(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value EvaluateFString(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value EvaluateComprehension(const Expr& expr, const std::shared_ptr<Scope>& scope);
    Value EvaluateSubscript(const Expr& expr, const std::shared_ptr<Scope>& scope);
    std::vector<Value> EvaluateElements(const std::vector<ExprPtr>& elements, const std::shared_ptr<Scope>& scope);
    Value MakeFunction(const std::shared_ptr<FunctionDef>& def, const std::shared_ptr<Scope>& scope);
    Value DefineClass(const ClassDef& def, const std::shared_ptr<Scope>& scope);
    Value DefineExceptionClass(const ClassDef& def, const std::shared_ptr<const ExceptionType>& base);
    void Retain(const std::shared_ptr<Scope>& scope);
    std::shared_ptr<ComprehensionState> StartComprehension(const Expr& expr, const std::shared_ptr<Scope>& scope);
    bool AdvanceComprehension(ComprehensionState& state);

    Value LoadName(const std::string& name, Scope& scope);
    Value LoadGlobal(const std::string& name);
    Scope& StoreTarget(const std::string& name, Scope& scope);
    void StoreName(const std::string& name, Value value, Scope& scope);
    void DeleteName(const std::string& name, Scope& scope);
    void Assign(const Expr& target, const Value& value, const std::shared_ptr<Scope>& scope);
    void Delete(const Expr& target, const std::shared_ptr<Scope>& scope);
    void SetAttribute(const Value& object, const std::string& name, Value value);
    void DeleteAttribute(const Value& object, const std::string& name);
    Value InPlace(BinaryOperator op, const Value& lhs, const Value& rhs);

    Value CallFunction(const FunctionObject& function, CallArguments& args);
    void BindArguments(const FunctionObject& function, CallArguments& args, Scope& locals);
    Value Instantiate(const std::shared_ptr<const ExceptionType>& type, CallArguments& args);
    Value Construct(const std::shared_ptr<ClassObject>& cls, CallArguments& args);
    Value ExportAt(const Value& value, int depth);
    Value ToException(const Value& value);
    bool Matches(const Value& exception, const Value& handler_type);

    std::unordered_map<std::string, Value> builtins_;
    InterpreterLimits limits_;
    std::shared_ptr<const CancelToken> cancel_;
    std::shared_ptr<Scope> module_;
    std::vector<std::shared_ptr<const Program>> programs_;
    // Scopes captured by closures; cleared on destruction to break cycles.
    std::vector<std::weak_ptr<Scope>> closures_;
    std::size_t prune_at_ = 1024;
    // Containers, instances, classes and functions created while running;
    // their contents are released on destruction.
    std::vector<std::weak_ptr<Object>> tracked_;
    std::size_t track_prune_at_ = 4096;
    // Exceptions being handled by enclosing except blocks, for bare `raise`.
    std::vector<ScriptException> handling_;
    int depth_ = 0;
};

}  // namespace evalbox::lang
