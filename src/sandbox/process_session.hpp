#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "sandbox/execution_session.hpp"
#include "sandbox/wire_codec.hpp"

namespace evalbox::sandbox {

// Process backend: every define and call runs in a fresh evalbox-worker
// process that is killed with its process group at the deadline.
class ProcessSession : public ExecutionSession {
public:
    ProcessSession(SessionConfig config, std::string source);

    ExecutionOutcome Define(std::chrono::milliseconds deadline) override;
    std::vector<std::string> Callables() const override;
    bool HasCallable(const std::string& name) const override;
    ExecutionOutcome Call(const std::string& name,
                          const std::vector<lang::Value>& args,
                          std::chrono::milliseconds deadline) override;

private:
    WorkerRequest MakeRequest(const std::string& op, std::chrono::milliseconds deadline) const;
    WorkerResponse Exchange(const WorkerRequest& request, std::chrono::milliseconds deadline) const;

    SessionConfig config_;
    std::string source_;
    std::vector<std::string> callables_;
    bool defined_ = false;
};

}  // namespace evalbox::sandbox
