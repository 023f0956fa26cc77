#include "sandbox/process_session.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace evalbox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

struct WorkerExit {
    bool finished = false;
    int status = 0;
};

// Temporary files for one worker run, removed on scope exit.
class ScratchFiles {
public:
    ScratchFiles() {
        static std::atomic<unsigned> counter{0};
        const auto stamp = std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)) + "_" +
                           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        const auto dir = std::filesystem::temp_directory_path();
        request = dir / ("evalbox_request_" + stamp + ".json");
        output = dir / ("evalbox_stdout_" + stamp + ".json");
        error = dir / ("evalbox_stderr_" + stamp + ".log");
    }

    ~ScratchFiles() {
        std::error_code ec;
        std::filesystem::remove(request, ec);
        std::filesystem::remove(output, ec);
        std::filesystem::remove(error, ec);
    }

    ScratchFiles(const ScratchFiles&) = delete;
    ScratchFiles& operator=(const ScratchFiles&) = delete;

    std::filesystem::path request;
    std::filesystem::path output;
    std::filesystem::path error;
};

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return "";
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    return stream.str();
}

WorkerExit WaitUntil(pid_t pid, std::chrono::steady_clock::time_point deadline) {
    WorkerExit exit;
    auto pause = std::chrono::milliseconds(1);
    while (std::chrono::steady_clock::now() < deadline) {
        const auto waited = ::waitpid(pid, &exit.status, WNOHANG);
        if (waited == pid) {
            exit.finished = true;
            return exit;
        }
        if (waited < 0) {
            return exit;
        }
        std::this_thread::sleep_for(pause);
        pause = std::min(pause * 2, std::chrono::milliseconds(20));
    }
    return exit;
}

// Abnormal worker exits under RLIMIT_AS surface as these signals or as an
// abort from a failed allocation.
bool LooksLikeMemoryExhaustion(int status) {
    if (!WIFSIGNALED(status)) {
        return false;
    }
    const int signal = WTERMSIG(status);
    return signal == SIGSEGV || signal == SIGKILL || signal == SIGABRT || signal == SIGBUS;
}

}  // namespace

ProcessSession::ProcessSession(SessionConfig config, std::string source)
    : config_(std::move(config)), source_(std::move(source)) {}

WorkerRequest ProcessSession::MakeRequest(const std::string& op, std::chrono::milliseconds deadline) const {
    WorkerRequest request;
    request.op = op;
    request.source = source_;
    request.limits.max_call_depth = config_.limits.max_call_depth;
    request.limits.max_container_size = config_.limits.max_container_size;
    request.limits.max_output_bytes = config_.environment.max_output_bytes;
    request.limits.timeout_ms = deadline.count();
    request.limits.memory_limit_mb = config_.memory_limit_mb;
    return request;
}

WorkerResponse ProcessSession::Exchange(const WorkerRequest& request, std::chrono::milliseconds deadline) const {
    WorkerResponse response;
    ScratchFiles files;
    {
        std::ofstream out(files.request);
        out << DumpJson(EncodeRequest(request));
        if (!out) {
            utils::Log(utils::LogLevel::kError, "runner", "failed to write worker request");
            response.outcome = ExecutionOutcome::InternalError("failed to write worker request");
            return response;
        }
    }

    const auto started = std::chrono::steady_clock::now();
    WorkerExit exit;
    try {
        bp::child worker(config_.worker_path,
                         bp::std_in < files.request.string(),
                         bp::std_out > files.output.string(),
                         bp::std_err > files.error.string(),
                         bp::extend::on_exec_setup = [](auto&) { ::setpgid(0, 0); });
        const pid_t pid = worker.id();
        exit = WaitUntil(pid, started + deadline);
        if (!exit.finished) {
            ::kill(-pid, SIGKILL);
            ::kill(pid, SIGKILL);
            ::waitpid(pid, &exit.status, 0);
        }
        worker.detach();
    } catch (const bp::process_error& ex) {
        utils::Log(utils::LogLevel::kError, "runner", "failed to start worker",
                   {{"worker", config_.worker_path}, {"error", ex.what()}});
        response.outcome = ExecutionOutcome::InternalError("failed to start worker");
        return response;
    }

    if (!exit.finished) {
        utils::Log(utils::LogLevel::kWarn, "runner", "worker killed at deadline",
                   {{"deadline_ms", std::to_string(deadline.count())},
                    {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}});
        response.outcome = ExecutionOutcome::Timeout();
        return response;
    }

    const auto text = ReadFile(files.output);
    if (WIFEXITED(exit.status) && WEXITSTATUS(exit.status) == 0 && !text.empty()) {
        try {
            return DecodeResponse(nlohmann::json::parse(text));
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kError, "runner", "unreadable worker response", {{"error", ex.what()}});
            response.outcome = ExecutionOutcome::InternalError("unreadable worker response");
            return response;
        }
    }

    const auto diagnostics = utils::Truncate(ReadFile(files.error), 512);
    if (LooksLikeMemoryExhaustion(exit.status) ||
        diagnostics.find("bad_alloc") != std::string::npos) {
        utils::Log(utils::LogLevel::kWarn, "runner", "worker ran out of memory",
                   {{"status", std::to_string(exit.status)}});
        response.outcome = ExecutionOutcome::RuntimeFailure("MemoryError", "memory limit exceeded");
        return response;
    }
    utils::Log(utils::LogLevel::kError, "runner", "worker exited abnormally",
               {{"status", std::to_string(exit.status)}, {"stderr", diagnostics}});
    response.outcome = ExecutionOutcome::InternalError("worker exited abnormally");
    return response;
}

ExecutionOutcome ProcessSession::Define(std::chrono::milliseconds deadline) {
    auto response = Exchange(MakeRequest("define", deadline), deadline);
    if (response.outcome.ok()) {
        callables_ = std::move(response.callables);
        defined_ = true;
    } else if (response.outcome.kind == OutcomeKind::kRuntimeFailure) {
        return ExecutionOutcome::DefinitionFailure(response.outcome.error_kind, response.outcome.detail,
                                                   response.outcome.line);
    }
    return response.outcome;
}

std::vector<std::string> ProcessSession::Callables() const {
    return callables_;
}

bool ProcessSession::HasCallable(const std::string& name) const {
    return std::find(callables_.begin(), callables_.end(), name) != callables_.end();
}

ExecutionOutcome ProcessSession::Call(const std::string& name,
                                      const std::vector<lang::Value>& args,
                                      std::chrono::milliseconds deadline) {
    if (!defined_) {
        return ExecutionOutcome::InternalError("call before successful define");
    }
    auto request = MakeRequest("call", deadline);
    request.target = name;
    request.args = args;
    auto response = Exchange(request, deadline);
    // The worker redefines the module on every call; a definition error there
    // means the module is not deterministic and counts against the call.
    if (response.outcome.kind == OutcomeKind::kDefinitionFailure) {
        return ExecutionOutcome::RuntimeFailure(response.outcome.error_kind, response.outcome.detail,
                                                response.outcome.line);
    }
    return response.outcome;
}

}  // namespace evalbox::sandbox
