#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "judge/test_case.hpp"
#include "lang/value.hpp"

namespace evalbox::judge {

struct EvaluationRequest {
    Submission submission;
    std::vector<TestCase> cases;
};

// Plain JSON to script values: arrays become lists, objects dicts, and the
// tagged objects {"$tuple": [...]} and {"$set": [...]} tuples and sets.
// Throws std::invalid_argument on values that have no script counterpart.
lang::Value ValueFromJson(const nlohmann::json& data);

// {"source": str, "function": str, "test_cases": [[[inputs...], expected], ...]}
EvaluationRequest ParseRequest(const nlohmann::json& data);
// Throws std::runtime_error when the file cannot be read or parsed.
EvaluationRequest LoadRequestFile(const std::filesystem::path& path);

}  // namespace evalbox::judge
