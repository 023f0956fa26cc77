#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include "lang/interpreter.hpp"
#include "sandbox/outcome.hpp"

namespace evalbox::sandbox {

using Task = std::function<ExecutionOutcome()>;

// Runs task and converts whatever it throws into an outcome: submission
// exceptions become runtime failures, cancellation becomes a timeout and host
// exceptions become internal errors.
ExecutionOutcome RunGuarded(const Task& task);

// Runs one task on a dedicated thread and waits at most `deadline` for it.
// On expiry the thread is abandoned and `cancel` is fired so the interpreter
// stops at its next poll. Everything the task captures must be owned by the
// task itself, since the caller may return long before the thread does.
class BoundedRunner {
public:
    static ExecutionOutcome Run(Task task,
                                std::shared_ptr<lang::CancelToken> cancel,
                                std::chrono::milliseconds deadline);
};

}  // namespace evalbox::sandbox
