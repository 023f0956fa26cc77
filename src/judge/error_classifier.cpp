#include "judge/error_classifier.hpp"

#include <algorithm>
#include <sstream>
#include <utility>

#include "lang/script_error.hpp"
#include "utils/common.hpp"

namespace evalbox::judge {
namespace {

constexpr std::size_t kMaxRenderedChars = 200;

struct Template {
    const char* title;
    const char* suggestion;
};

Template RuntimeTemplate(RuntimeKind kind) {
    switch (kind) {
        case RuntimeKind::kNameError:
            return {"❌ Undefined Variable", "💡 Make sure all variables are defined before use"};
        case RuntimeKind::kTypeError:
            return {"❌ Type Error", "💡 Check that you're using the correct data types for operations"};
        case RuntimeKind::kIndexError:
            return {"❌ Index Out of Range", "💡 Check your loop bounds and list indices"};
        case RuntimeKind::kKeyError:
            return {"❌ Missing Key", "💡 Check that the key exists before reading it, or use dict.get()"};
        case RuntimeKind::kArithmeticError:
            return {"❌ Arithmetic Error", "💡 Check for division by zero and for values that grow too large"};
        case RuntimeKind::kOther:
            break;
    }
    return {nullptr, "💡 Check your code logic and try again"};
}

std::string FormatSyntaxError(const sandbox::ExecutionOutcome& outcome, const std::string& source) {
    std::vector<std::string> lines;
    std::stringstream stream(source);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    const int line_no = outcome.line > 0 ? outcome.line : 1;
    const int start = std::max(0, line_no - 2);
    const int end = std::min(static_cast<int>(lines.size()), line_no + 1);

    std::ostringstream out;
    out << "❌ Syntax Error\n";
    out << "\n📍 Error at line " << line_no;
    if (outcome.column > 0) {
        out << ", column " << outcome.column;
    }
    out << ": " << outcome.detail << "\n";
    out << "\n```\n";
    for (int i = start; i < end; ++i) {
        out << (i == line_no - 1 ? "→ " : "  ") << (i + 1) << ": "
            << utils::Truncate(lines[static_cast<std::size_t>(i)], kMaxRenderedChars) << "\n";
    }
    out << "```\n";
    out << "\n💡 Check for missing colons, parentheses, or quotes";
    return out.str();
}

std::string FormatIndentationError(const sandbox::ExecutionOutcome& outcome) {
    std::ostringstream out;
    out << "❌ Indentation Error: " << outcome.detail;
    if (outcome.line > 0) {
        out << " (line " << outcome.line << ")";
    }
    out << "\n\n💡 Check that your code uses consistent spaces (4 spaces per indent level)";
    return out.str();
}

std::string FormatUnsupportedFeature(const sandbox::ExecutionOutcome& outcome) {
    std::ostringstream out;
    out << "❌ Unsupported Feature";
    if (outcome.line > 0) {
        out << "\n\n📍 Line " << outcome.line;
    }
    out << ": " << outcome.detail;
    out << "\n\n💡 This construct is valid Python but is not available here. "
           "Rewrite it with plain functions, loops and built-in types";
    return out.str();
}

std::string FormatDefinitionError(const sandbox::ExecutionOutcome& outcome) {
    std::ostringstream out;
    out << "❌ Error while defining your code:\n\n`" << outcome.error_kind;
    if (!outcome.detail.empty()) {
        out << ": " << utils::Truncate(outcome.detail, kMaxRenderedChars);
    }
    out << "`";
    if (outcome.line > 0) {
        out << "\n📍 Line " << outcome.line;
    }
    out << "\n\n💡 Check your function definition for errors";
    return out.str();
}

std::string DescribeDeadline(std::chrono::milliseconds deadline) {
    const auto ms = deadline.count();
    if (ms % 1000 == 0) {
        const auto seconds = ms / 1000;
        return std::to_string(seconds) + (seconds == 1 ? " second" : " seconds");
    }
    return std::to_string(ms) + " ms";
}

std::string FormatTimeout(const FailureContext& context) {
    std::ostringstream out;
    out << "❌ Time Limit Exceeded: Execution exceeded " << DescribeDeadline(context.deadline);
    if (!context.input.empty()) {
        out << "\n📥 **Input:** `" << context.input << "`";
    } else {
        out << " while defining your code";
    }
    out << "\n\n💡 Your code took too long. Check for infinite loops or optimize your solution";
    return out.str();
}

std::string FormatRuntimeFailure(const sandbox::ExecutionOutcome& outcome, RuntimeKind kind,
                                 const FailureContext& context) {
    const auto templ = RuntimeTemplate(kind);
    std::ostringstream out;
    const std::string detail = utils::Truncate(outcome.detail, kMaxRenderedChars);
    if (templ.title == nullptr) {
        out << "❌ " << outcome.error_kind;
        if (!detail.empty()) {
            out << ": " << detail;
        }
    } else {
        out << templ.title;
        const bool named_by_title = outcome.error_kind == ToString(kind);
        if (!named_by_title || !detail.empty()) {
            out << ": ";
        }
        if (!named_by_title) {
            out << outcome.error_kind << (detail.empty() ? "" : ": ");
        }
        out << detail;
    }
    if (outcome.line > 0) {
        out << "\n📍 Line " << outcome.line;
    }
    if (!context.input.empty()) {
        out << "\n📥 **Input:** `" << context.input << "`";
    }
    out << "\n\n" << templ.suggestion;
    return out.str();
}

}  // namespace

RuntimeKind ErrorClassifier::ClassifyRuntime(const std::string& exception_kind) {
    const auto type = lang::FindExceptionType(exception_kind);
    if (!type) {
        return RuntimeKind::kOther;
    }
    const std::pair<const char*, RuntimeKind> kOrder[] = {
        {"NameError", RuntimeKind::kNameError},
        {"TypeError", RuntimeKind::kTypeError},
        {"IndexError", RuntimeKind::kIndexError},
        {"KeyError", RuntimeKind::kKeyError},
        {"ArithmeticError", RuntimeKind::kArithmeticError},
    };
    for (const auto& [name, kind] : kOrder) {
        if (type->IsSubclassOf(*lang::FindExceptionType(name))) {
            return kind;
        }
    }
    return RuntimeKind::kOther;
}

Classification ErrorClassifier::Classify(const sandbox::ExecutionOutcome& outcome, const FailureContext& context) {
    using sandbox::OutcomeKind;
    Classification result;
    switch (outcome.kind) {
        case OutcomeKind::kSuccess:
            result.category = Category::kPassed;
            break;
        case OutcomeKind::kSecurityViolation:
            result.category = Category::kSecurityViolation;
            result.message = FormatSecurityViolation(outcome.detail);
            break;
        case OutcomeKind::kDefinitionFailure:
            result.category = Category::kDefinitionFailure;
            if (outcome.error_kind == "SyntaxError") {
                result.message = FormatSyntaxError(outcome, context.source);
            } else if (outcome.error_kind == "IndentationError") {
                result.message = FormatIndentationError(outcome);
            } else if (outcome.error_kind == "UnsupportedFeature") {
                result.message = FormatUnsupportedFeature(outcome);
            } else {
                result.message = FormatDefinitionError(outcome);
            }
            break;
        case OutcomeKind::kTimeout:
            result.category = Category::kTimeout;
            result.message = FormatTimeout(context);
            break;
        case OutcomeKind::kRuntimeFailure: {
            const auto kind = ClassifyRuntime(outcome.error_kind);
            result.category = Category::kRuntimeFailure;
            result.runtime_kind = kind;
            result.message = FormatRuntimeFailure(outcome, kind, context);
            break;
        }
        case OutcomeKind::kInternalError:
            result.category = Category::kInternalError;
            result.message = FormatInternalError();
            break;
    }
    return result;
}

std::string FormatSecurityViolation(const std::string& reason) {
    return "🔒 Security Error: " + reason;
}

std::string FormatNameResolutionFailure(const std::string& target, const std::vector<std::string>& found) {
    std::ostringstream out;
    out << "❌ Function name doesn't match the required name\n\n";
    out << "❌ Expected function: `" << target << "`\n";
    if (!found.empty()) {
        out << "📝 Found: `" << utils::Join(found, ", ") << "`\n";
    }
    out << "\n💡 Make sure your function is named exactly as shown in the template";
    return out.str();
}

std::string FormatOutputInsteadOfReturn() {
    return "❌ You're using print() instead of return\n\n💡 Replace print(...) with return ... to return the value";
}

std::string FormatMissingReturn() {
    return "❌ Your function doesn't return anything\n\n💡 Add a 'return' statement at the end of your function";
}

std::string FormatValueMismatch(const std::string& input, const lang::Value& expected, const lang::Value& actual) {
    std::ostringstream out;
    out << "❌ Test Case Failed\n\n";
    out << "📥 **Input:** `" << input << "`\n";
    out << "✅ **Expected:** `" << RenderValue(expected) << "`\n";
    out << "❌ **Got:** `" << RenderValue(actual) << "`";
    const auto expected_type = lang::TypeName(expected);
    const auto actual_type = lang::TypeName(actual);
    if (expected_type != actual_type) {
        out << "\n\n⚠️ **Type mismatch:** Expected `" << expected_type << "`, got `" << actual_type << "`";
        out << "\n💡 Make sure you're returning the correct data type";
    }
    return out.str();
}

std::string FormatPassed(std::size_t count) {
    return "✅ All " + std::to_string(count) + " test cases passed!";
}

std::string FormatInternalError() {
    return "⚠️ Internal error while evaluating your code. Please try again.";
}

std::string RenderValue(const lang::Value& value) {
    try {
        return utils::Truncate(lang::Repr(value), kMaxRenderedChars);
    } catch (const lang::ScriptException& ex) {
        return "<" + lang::TypeName(value) + " value that cannot be displayed: " + ex.TypeName() + ">";
    }
}

std::string RenderInputs(const std::vector<lang::Value>& inputs) {
    return RenderValue(lang::Value::Tuple(inputs));
}

}  // namespace evalbox::judge
