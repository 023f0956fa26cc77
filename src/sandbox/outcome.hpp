#pragma once

#include <string>

#include "lang/value.hpp"

namespace evalbox::sandbox {

enum class OutcomeKind {
    kSuccess,
    kRuntimeFailure,
    kTimeout,
    kSecurityViolation,
    kDefinitionFailure,
    kInternalError
};

const char* ToString(OutcomeKind kind);
bool ParseOutcomeKind(const std::string& text, OutcomeKind& kind);

// Result of one runner invocation. Built through the named constructors and
// not modified afterwards.
struct ExecutionOutcome {
    OutcomeKind kind = OutcomeKind::kInternalError;
    lang::Value value;
    // Text printed by the submission during the call.
    std::string output;
    // Exception name for runtime failures; for definition failures the
    // parser's kind ("SyntaxError", "IndentationError", "UnsupportedFeature")
    // or the exception name.
    std::string error_kind;
    std::string detail;
    int line = 0;
    int column = 0;

    static ExecutionOutcome Success(lang::Value value, std::string output);
    static ExecutionOutcome RuntimeFailure(std::string error_kind, std::string detail, int line = 0);
    static ExecutionOutcome Timeout();
    static ExecutionOutcome SecurityViolation(std::string reason, int line = 0);
    static ExecutionOutcome DefinitionFailure(std::string error_kind, std::string detail, int line = 0,
                                              int column = 0);
    static ExecutionOutcome InternalError(std::string detail);

    bool ok() const { return kind == OutcomeKind::kSuccess; }
};

}  // namespace evalbox::sandbox
