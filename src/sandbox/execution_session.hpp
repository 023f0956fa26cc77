#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lang/interpreter.hpp"
#include "sandbox/environment.hpp"
#include "sandbox/outcome.hpp"

namespace evalbox::sandbox {

enum class Isolation {
    kThread,
    kProcess
};

const char* ToString(Isolation isolation);
bool ParseIsolation(const std::string& text, Isolation& isolation);

struct SessionConfig {
    Isolation isolation = Isolation::kThread;
    // evalbox-worker executable, process isolation only.
    std::string worker_path;
    std::uint64_t memory_limit_mb = 256;
    lang::InterpreterLimits limits;
    EnvironmentOptions environment;
};

// One submission's definitions plus the calls made against them. A session
// is used by one thread at a time.
class ExecutionSession {
public:
    virtual ~ExecutionSession() = default;

    // Runs the module's top-level statements. Syntax errors and exceptions
    // become DefinitionFailure outcomes.
    virtual ExecutionOutcome Define(std::chrono::milliseconds deadline) = 0;
    // Callable module globals not starting with '_', in definition order.
    virtual std::vector<std::string> Callables() const = 0;
    virtual bool HasCallable(const std::string& name) const = 0;
    virtual ExecutionOutcome Call(const std::string& name,
                                  const std::vector<lang::Value>& args,
                                  std::chrono::milliseconds deadline) = 0;
};

// In-process backend: definitions and calls run on BoundedRunner threads
// against one interpreter. After a timeout the session refuses further calls.
class ThreadSession : public ExecutionSession {
public:
    ThreadSession(SessionConfig config, std::string source);

    ExecutionOutcome Define(std::chrono::milliseconds deadline) override;
    std::vector<std::string> Callables() const override;
    bool HasCallable(const std::string& name) const override;
    ExecutionOutcome Call(const std::string& name,
                          const std::vector<lang::Value>& args,
                          std::chrono::milliseconds deadline) override;

private:
    // Shared with runner threads, which may outlive the session.
    struct State {
        std::string source;
        Environment environment;
        std::shared_ptr<lang::CancelToken> cancel;
        std::unique_ptr<lang::Interpreter> interpreter;
        std::vector<std::string> callables;
    };

    std::shared_ptr<State> state_;
    std::vector<std::string> callables_;
    bool defined_ = false;
    bool abandoned_ = false;
};

std::unique_ptr<ExecutionSession> CreateSession(const SessionConfig& config, std::string program_source);

// Callable, non-private globals of an interpreter in definition order.
std::vector<std::string> CollectCallables(const lang::Interpreter& interpreter);

// Parses and runs source in interpreter, mapping syntax errors and
// submission exceptions to DefinitionFailure.
ExecutionOutcome DefineModule(lang::Interpreter& interpreter, const std::string& source);

}  // namespace evalbox::sandbox
