#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace evalbox::judge {

enum class Category {
    kPassed,
    kSecurityViolation,
    kDefinitionFailure,
    kNameResolutionFailure,
    kTimeout,
    kRuntimeFailure,
    kOutputInsteadOfReturn,
    kMissingReturn,
    kValueMismatch,
    kInternalError
};

enum class RuntimeKind {
    kNameError,
    kTypeError,
    kIndexError,
    kKeyError,
    kArithmeticError,
    kOther
};

inline const char* ToString(Category category) {
    switch (category) {
        case Category::kPassed: return "Passed";
        case Category::kSecurityViolation: return "SecurityViolation";
        case Category::kDefinitionFailure: return "DefinitionFailure";
        case Category::kNameResolutionFailure: return "NameResolutionFailure";
        case Category::kTimeout: return "Timeout";
        case Category::kRuntimeFailure: return "RuntimeFailure";
        case Category::kOutputInsteadOfReturn: return "OutputInsteadOfReturn";
        case Category::kMissingReturn: return "MissingReturn";
        case Category::kValueMismatch: return "ValueMismatch";
        case Category::kInternalError: return "InternalError";
    }
    return "InternalError";
}

inline const char* ToString(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::kNameError: return "NameError";
        case RuntimeKind::kTypeError: return "TypeError";
        case RuntimeKind::kIndexError: return "IndexError";
        case RuntimeKind::kKeyError: return "KeyError";
        case RuntimeKind::kArithmeticError: return "ArithmeticError";
        case RuntimeKind::kOther: return "Other";
    }
    return "Other";
}

struct EvaluationVerdict {
    bool passed = false;
    std::string message;
    Category category = Category::kInternalError;
    // Set for kRuntimeFailure.
    std::optional<RuntimeKind> runtime_kind;
    // Exception name as raised by the submission, e.g. "ZeroDivisionError".
    std::string error_kind;
    // Set for kValueMismatch when expected and actual differ in type.
    bool type_mismatch = false;
    std::size_t cases_passed = 0;
};

}  // namespace evalbox::judge
