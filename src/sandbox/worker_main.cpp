#include <cerrno>
#include <cstring>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <sys/prctl.h>
#include <sys/resource.h>

#include "config/config_loader.hpp"
#include "lang/interpreter.hpp"
#include "lang/script_error.hpp"
#include "sandbox/bounded_runner.hpp"
#include "sandbox/environment.hpp"
#include "sandbox/execution_session.hpp"
#include "sandbox/wire_codec.hpp"
#include "utils/logging.hpp"

namespace {

using evalbox::sandbox::ExecutionOutcome;
using evalbox::utils::LogLevel;

// Responses are written to a regular file, so RLIMIT_FSIZE caps them.
constexpr rlim_t kMaxResponseBytes = 64ull * 1024 * 1024;
constexpr rlim_t kMaxOpenFiles = 16;

bool SetLimit(int resource, rlim_t soft, rlim_t hard, const char* name) {
    rlimit limit{soft, hard};
    if (::setrlimit(resource, &limit) != 0) {
        evalbox::utils::Log(LogLevel::kError, "worker", "setrlimit failed",
                            {{"resource", name}, {"error", std::strerror(errno)}});
        return false;
    }
    return true;
}

bool ApplyLimits(const evalbox::sandbox::WorkerLimits& limits) {
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        evalbox::utils::Log(LogLevel::kError, "worker", "PR_SET_NO_NEW_PRIVS failed", {{"error", std::strerror(errno)}});
        return false;
    }
    if (limits.memory_limit_mb > 0) {
        const rlim_t bytes = static_cast<rlim_t>(limits.memory_limit_mb) * 1024 * 1024;
        if (!SetLimit(RLIMIT_AS, bytes, bytes, "RLIMIT_AS")) {
            return false;
        }
    }
    const rlim_t cpu_seconds = static_cast<rlim_t>(limits.timeout_ms / 1000 + 1);
    return SetLimit(RLIMIT_CPU, cpu_seconds, cpu_seconds + 1, "RLIMIT_CPU") &&
           SetLimit(RLIMIT_FSIZE, kMaxResponseBytes, kMaxResponseBytes, "RLIMIT_FSIZE") &&
           SetLimit(RLIMIT_NOFILE, kMaxOpenFiles, kMaxOpenFiles, "RLIMIT_NOFILE");
}

evalbox::sandbox::WorkerResponse Handle(const evalbox::sandbox::WorkerRequest& request) {
    namespace sandbox = evalbox::sandbox;
    evalbox::lang::InterpreterLimits limits;
    limits.max_call_depth = request.limits.max_call_depth;
    limits.max_container_size = static_cast<std::size_t>(request.limits.max_container_size);
    sandbox::EnvironmentOptions options;
    options.max_output_bytes = static_cast<std::size_t>(request.limits.max_output_bytes);
    auto environment = sandbox::EnvironmentBuilder(std::move(options)).Build();
    evalbox::lang::Interpreter interpreter(environment.builtins, limits);

    sandbox::WorkerResponse response;
    response.outcome = sandbox::RunGuarded([&]() {
        auto defined = sandbox::DefineModule(interpreter, request.source);
        if (!defined.ok()) {
            return defined;
        }
        response.callables = sandbox::CollectCallables(interpreter);
        if (request.op == "define") {
            return defined;
        }
        environment.output->Clear();
        const auto* callee = interpreter.LookupGlobal(request.target);
        if (callee == nullptr) {
            evalbox::lang::ThrowError("NameError", "name '" + request.target + "' is not defined");
        }
        const evalbox::lang::Value target = *callee;
        std::vector<evalbox::lang::Value> args;
        args.reserve(request.args.size());
        for (const auto& arg : request.args) {
            args.push_back(interpreter.Adopt(arg));
        }
        auto value = interpreter.Export(interpreter.Call(target, std::move(args)));
        return ExecutionOutcome::Success(std::move(value), environment.output->Contents());
    });
    return response;
}

}  // namespace

int main() {
    evalbox::utils::LogConfig log_config;
    log_config.min_level = evalbox::config::LoadConfig().log.level;
    evalbox::utils::ConfigureLogging(log_config);

    const std::string input((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    evalbox::sandbox::WorkerRequest request;
    try {
        request = evalbox::sandbox::DecodeRequest(nlohmann::json::parse(input));
    } catch (const std::exception& ex) {
        evalbox::utils::Log(LogLevel::kError, "worker", "invalid request", {{"error", ex.what()}});
        return 2;
    }
    if (!ApplyLimits(request.limits)) {
        return 3;
    }

    auto response = Handle(request);
    std::string text;
    try {
        text = evalbox::sandbox::DumpJson(evalbox::sandbox::EncodeResponse(response));
    } catch (const std::exception& ex) {
        evalbox::utils::Log(LogLevel::kError, "worker", "failed to encode response", {{"error", ex.what()}});
        response.outcome = ExecutionOutcome::RuntimeFailure("ValueError", "return value cannot be transferred");
        text = evalbox::sandbox::DumpJson(evalbox::sandbox::EncodeResponse(response));
    }
    if (text.size() >= kMaxResponseBytes) {
        response.outcome = ExecutionOutcome::RuntimeFailure("MemoryError", "return value too large");
        text = evalbox::sandbox::DumpJson(evalbox::sandbox::EncodeResponse(response));
    }
    std::cout << text << std::flush;
    return std::cout ? 0 : 4;
}
