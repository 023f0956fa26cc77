#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lang/value.hpp"
#include "sandbox/outcome.hpp"

namespace evalbox::sandbox {

// Lossless tagged encoding used between the host and evalbox-worker:
// {"t": "int", "v": 3}, {"t": "tuple", "v": [...]}, {"t": "dict", "v": [[k, v], ...]}.
// Values that cannot cross a process boundary (functions, iterators) are
// sent as {"t": "opaque", "type": ..., "repr": ...}.
nlohmann::json EncodeValue(const lang::Value& value);
// Throws std::invalid_argument on malformed input.
lang::Value DecodeValue(const nlohmann::json& data);

nlohmann::json EncodeOutcome(const ExecutionOutcome& outcome);
ExecutionOutcome DecodeOutcome(const nlohmann::json& data);

struct WorkerLimits {
    int max_call_depth = 200;
    std::uint64_t max_container_size = 10000000;
    std::uint64_t max_output_bytes = 64 * 1024;
    std::int64_t timeout_ms = 5000;
    std::uint64_t memory_limit_mb = 256;
};

struct WorkerRequest {
    // "define" runs the module and lists callables; "call" also calls target.
    std::string op = "define";
    std::string source;
    std::string target;
    std::vector<lang::Value> args;
    WorkerLimits limits;
};

struct WorkerResponse {
    ExecutionOutcome outcome;
    std::vector<std::string> callables;
};

nlohmann::json EncodeRequest(const WorkerRequest& request);
WorkerRequest DecodeRequest(const nlohmann::json& data);
nlohmann::json EncodeResponse(const WorkerResponse& response);
WorkerResponse DecodeResponse(const nlohmann::json& data);

// Serializes without failing on invalid UTF-8 in submission strings.
std::string DumpJson(const nlohmann::json& data);

}  // namespace evalbox::sandbox
