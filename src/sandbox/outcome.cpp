#include "sandbox/outcome.hpp"

namespace evalbox::sandbox {

const char* ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kSuccess: return "success";
        case OutcomeKind::kRuntimeFailure: return "runtime_failure";
        case OutcomeKind::kTimeout: return "timeout";
        case OutcomeKind::kSecurityViolation: return "security_violation";
        case OutcomeKind::kDefinitionFailure: return "definition_failure";
        case OutcomeKind::kInternalError: return "internal_error";
    }
    return "internal_error";
}

bool ParseOutcomeKind(const std::string& text, OutcomeKind& kind) {
    for (const auto candidate : {OutcomeKind::kSuccess, OutcomeKind::kRuntimeFailure, OutcomeKind::kTimeout,
                                 OutcomeKind::kSecurityViolation, OutcomeKind::kDefinitionFailure,
                                 OutcomeKind::kInternalError}) {
        if (text == ToString(candidate)) {
            kind = candidate;
            return true;
        }
    }
    return false;
}

ExecutionOutcome ExecutionOutcome::Success(lang::Value value, std::string output) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kSuccess;
    outcome.value = std::move(value);
    outcome.output = std::move(output);
    return outcome;
}

ExecutionOutcome ExecutionOutcome::RuntimeFailure(std::string error_kind, std::string detail, int line) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kRuntimeFailure;
    outcome.error_kind = std::move(error_kind);
    outcome.detail = std::move(detail);
    outcome.line = line;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::Timeout() {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kTimeout;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::SecurityViolation(std::string reason, int line) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kSecurityViolation;
    outcome.detail = std::move(reason);
    outcome.line = line;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::DefinitionFailure(std::string error_kind, std::string detail, int line,
                                                     int column) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kDefinitionFailure;
    outcome.error_kind = std::move(error_kind);
    outcome.detail = std::move(detail);
    outcome.line = line;
    outcome.column = column;
    return outcome;
}

ExecutionOutcome ExecutionOutcome::InternalError(std::string detail) {
    ExecutionOutcome outcome;
    outcome.kind = OutcomeKind::kInternalError;
    outcome.detail = std::move(detail);
    return outcome;
}

}  // namespace evalbox::sandbox
