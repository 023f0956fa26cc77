#include "sandbox/bounded_runner.hpp"

#include <condition_variable>
#include <mutex>
#include <new>
#include <optional>
#include <system_error>
#include <thread>

#include "lang/script_error.hpp"
#include "utils/logging.hpp"

namespace evalbox::sandbox {
namespace {

struct SharedState {
    std::mutex mutex;
    std::condition_variable done;
    std::optional<ExecutionOutcome> outcome;
};

}  // namespace

ExecutionOutcome RunGuarded(const Task& task) {
    try {
        return task();
    } catch (const lang::ScriptException& ex) {
        return ExecutionOutcome::RuntimeFailure(ex.TypeName(), ex.Message(), ex.line());
    } catch (const lang::ExecutionCancelled&) {
        return ExecutionOutcome::Timeout();
    } catch (const std::bad_alloc&) {
        return ExecutionOutcome::RuntimeFailure("MemoryError", "out of memory");
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "unexpected host exception", {{"error", ex.what()}});
        return ExecutionOutcome::InternalError(ex.what());
    }
}

ExecutionOutcome BoundedRunner::Run(Task task,
                                    std::shared_ptr<lang::CancelToken> cancel,
                                    std::chrono::milliseconds deadline) {
    auto state = std::make_shared<SharedState>();
    std::thread worker;
    try {
        worker = std::thread([state, task = std::move(task)]() {
            auto outcome = RunGuarded(task);
            std::lock_guard<std::mutex> lock(state->mutex);
            state->outcome = std::move(outcome);
            state->done.notify_all();
        });
    } catch (const std::system_error& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "failed to start worker thread", {{"error", ex.what()}});
        return ExecutionOutcome::InternalError(ex.what());
    }

    std::unique_lock<std::mutex> lock(state->mutex);
    const bool finished = state->done.wait_for(lock, deadline, [&state]() { return state->outcome.has_value(); });
    if (finished) {
        auto outcome = std::move(*state->outcome);
        lock.unlock();
        worker.join();
        return outcome;
    }
    lock.unlock();
    if (cancel) {
        cancel->Cancel();
    }
    worker.detach();
    utils::Log(utils::LogLevel::kWarn, "runner", "deadline expired, worker abandoned",
               {{"deadline_ms", std::to_string(deadline.count())}});
    return ExecutionOutcome::Timeout();
}

}  // namespace evalbox::sandbox
