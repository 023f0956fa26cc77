#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "judge/verdict.hpp"
#include "lang/value.hpp"
#include "sandbox/outcome.hpp"

namespace evalbox::judge {

struct Classification {
    Category category = Category::kInternalError;
    std::optional<RuntimeKind> runtime_kind;
    std::string message;
};

// What the classifier may mention about the failing run.
struct FailureContext {
    // Used for syntax error excerpts.
    std::string source;
    // Rendered test input; empty while defining.
    std::string input;
    std::chrono::milliseconds deadline{5000};
};

// Maps execution outcomes to the verdict taxonomy and renders the fixed
// message templates. Messages only carry the submission's own exception
// name, message, line and test input.
class ErrorClassifier {
public:
    static RuntimeKind ClassifyRuntime(const std::string& exception_kind);
    static Classification Classify(const sandbox::ExecutionOutcome& outcome, const FailureContext& context);
};

std::string FormatSecurityViolation(const std::string& reason);
std::string FormatNameResolutionFailure(const std::string& target, const std::vector<std::string>& found);
std::string FormatOutputInsteadOfReturn();
std::string FormatMissingReturn();
std::string FormatValueMismatch(const std::string& input, const lang::Value& expected, const lang::Value& actual);
std::string FormatPassed(std::size_t count);
std::string FormatInternalError();

// repr, cut to 200 characters.
std::string RenderValue(const lang::Value& value);
// Inputs rendered as the argument tuple, e.g. (2, 3).
std::string RenderInputs(const std::vector<lang::Value>& inputs);

}  // namespace evalbox::judge
