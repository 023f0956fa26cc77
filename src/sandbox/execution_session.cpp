#include "sandbox/execution_session.hpp"

#include <algorithm>

#include "lang/parser.hpp"
#include "lang/script_error.hpp"
#include "sandbox/bounded_runner.hpp"
#include "sandbox/process_session.hpp"
#include "utils/logging.hpp"

namespace evalbox::sandbox {

const char* ToString(Isolation isolation) {
    switch (isolation) {
        case Isolation::kThread: return "thread";
        case Isolation::kProcess: return "process";
    }
    return "thread";
}

bool ParseIsolation(const std::string& text, Isolation& isolation) {
    if (text == "thread") {
        isolation = Isolation::kThread;
        return true;
    }
    if (text == "process") {
        isolation = Isolation::kProcess;
        return true;
    }
    return false;
}

std::vector<std::string> CollectCallables(const lang::Interpreter& interpreter) {
    std::vector<std::string> names;
    for (const auto& name : interpreter.GlobalNames()) {
        if (name.empty() || name[0] == '_') {
            continue;
        }
        const auto* value = interpreter.LookupGlobal(name);
        if (value != nullptr && value->IsCallable()) {
            names.push_back(name);
        }
    }
    return names;
}

ExecutionOutcome DefineModule(lang::Interpreter& interpreter, const std::string& source) {
    std::shared_ptr<const lang::Program> program;
    try {
        program = lang::ParseSource(source);
    } catch (const lang::SyntaxError& ex) {
        return ExecutionOutcome::DefinitionFailure(ex.kind(), ex.message(), ex.line(), ex.column());
    }
    try {
        interpreter.ExecuteModule(program);
    } catch (const lang::ScriptException& ex) {
        return ExecutionOutcome::DefinitionFailure(ex.TypeName(), ex.Message(), ex.line());
    }
    return ExecutionOutcome::Success(lang::Value::None(), "");
}

ThreadSession::ThreadSession(SessionConfig config, std::string source)
    : state_(std::make_shared<State>()) {
    state_->source = std::move(source);
    state_->environment = EnvironmentBuilder(std::move(config.environment)).Build();
    state_->cancel = std::make_shared<lang::CancelToken>();
    state_->interpreter = std::make_unique<lang::Interpreter>(state_->environment.builtins, config.limits,
                                                              state_->cancel);
}

ExecutionOutcome ThreadSession::Define(std::chrono::milliseconds deadline) {
    if (abandoned_) {
        return ExecutionOutcome::InternalError("session abandoned after timeout");
    }
    auto state = state_;
    auto outcome = BoundedRunner::Run(
        [state]() {
            auto result = DefineModule(*state->interpreter, state->source);
            if (result.ok()) {
                state->callables = CollectCallables(*state->interpreter);
            }
            return result;
        },
        state_->cancel, deadline);
    switch (outcome.kind) {
        case OutcomeKind::kSuccess:
            // The runner thread has been joined, so the snapshot is safe to read.
            callables_ = state_->callables;
            defined_ = true;
            break;
        case OutcomeKind::kTimeout:
            abandoned_ = true;
            break;
        case OutcomeKind::kRuntimeFailure:
            // Host-level failures such as bad_alloc while defining.
            return ExecutionOutcome::DefinitionFailure(outcome.error_kind, outcome.detail, outcome.line);
        default:
            break;
    }
    return outcome;
}

std::vector<std::string> ThreadSession::Callables() const {
    return callables_;
}

bool ThreadSession::HasCallable(const std::string& name) const {
    return std::find(callables_.begin(), callables_.end(), name) != callables_.end();
}

ExecutionOutcome ThreadSession::Call(const std::string& name,
                                     const std::vector<lang::Value>& args,
                                     std::chrono::milliseconds deadline) {
    if (abandoned_) {
        return ExecutionOutcome::InternalError("session abandoned after timeout");
    }
    if (!defined_) {
        return ExecutionOutcome::InternalError("call before successful define");
    }
    state_->environment.output->Clear();
    auto state = state_;
    auto outcome = BoundedRunner::Run(
        [state, name, args]() {
            const auto* callee = state->interpreter->LookupGlobal(name);
            if (callee == nullptr) {
                lang::ThrowError("NameError", "name '" + name + "' is not defined");
            }
            const lang::Value target = *callee;
            // Arguments are copied in and the result out, so neither side
            // shares a container with the other.
            std::vector<lang::Value> copies;
            copies.reserve(args.size());
            for (const auto& arg : args) {
                copies.push_back(state->interpreter->Adopt(arg));
            }
            auto value = state->interpreter->Export(state->interpreter->Call(target, std::move(copies)));
            return ExecutionOutcome::Success(std::move(value), state->environment.output->Contents());
        },
        state_->cancel, deadline);
    if (outcome.kind == OutcomeKind::kTimeout) {
        abandoned_ = true;
    }
    return outcome;
}

std::unique_ptr<ExecutionSession> CreateSession(const SessionConfig& config, std::string program_source) {
    if (config.isolation == Isolation::kProcess) {
        utils::Log(utils::LogLevel::kDebug, "runner", "creating process session",
                   {{"worker", config.worker_path}});
        return std::make_unique<ProcessSession>(config, std::move(program_source));
    }
    return std::make_unique<ThreadSession>(config, std::move(program_source));
}

}  // namespace evalbox::sandbox
