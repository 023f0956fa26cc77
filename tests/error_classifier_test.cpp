#include <gtest/gtest.h>

#include "judge/error_classifier.hpp"

namespace evalbox::judge {
namespace {

using sandbox::ExecutionOutcome;

bool Has(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

TEST(ErrorClassifierTest, RuntimeKindsFollowTheHierarchy) {
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("NameError"), RuntimeKind::kNameError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("UnboundLocalError"), RuntimeKind::kNameError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("TypeError"), RuntimeKind::kTypeError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("IndexError"), RuntimeKind::kIndexError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("KeyError"), RuntimeKind::kKeyError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("ZeroDivisionError"), RuntimeKind::kArithmeticError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("OverflowError"), RuntimeKind::kArithmeticError);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("ValueError"), RuntimeKind::kOther);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("RecursionError"), RuntimeKind::kOther);
    EXPECT_EQ(ErrorClassifier::ClassifyRuntime("SomethingElse"), RuntimeKind::kOther);
}

TEST(ErrorClassifierTest, RuntimeFailureMessage) {
    FailureContext context;
    context.input = "([1, 2, 3],)";
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::RuntimeFailure("IndexError", "list index out of range", 3), context);
    EXPECT_EQ(result.category, Category::kRuntimeFailure);
    ASSERT_TRUE(result.runtime_kind);
    EXPECT_EQ(*result.runtime_kind, RuntimeKind::kIndexError);
    EXPECT_TRUE(Has(result.message, "❌ Index Out of Range: list index out of range"));
    EXPECT_TRUE(Has(result.message, "📍 Line 3"));
    EXPECT_TRUE(Has(result.message, "📥 **Input:** `([1, 2, 3],)`"));
    EXPECT_TRUE(Has(result.message, "💡 Check your loop bounds and list indices"));
}

TEST(ErrorClassifierTest, SubclassIsNamedInMessage) {
    FailureContext context;
    context.input = "(1, 0)";
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::RuntimeFailure("ZeroDivisionError", "division by zero", 2), context);
    EXPECT_EQ(*result.runtime_kind, RuntimeKind::kArithmeticError);
    EXPECT_TRUE(Has(result.message, "❌ Arithmetic Error: ZeroDivisionError: division by zero"));
}

TEST(ErrorClassifierTest, OtherRuntimeErrorsUseTheirOwnName) {
    const auto result =
        ErrorClassifier::Classify(ExecutionOutcome::RuntimeFailure("ValueError", "bad value"), FailureContext{});
    EXPECT_EQ(*result.runtime_kind, RuntimeKind::kOther);
    EXPECT_TRUE(Has(result.message, "❌ ValueError: bad value"));
    EXPECT_TRUE(Has(result.message, "💡 Check your code logic and try again"));
    EXPECT_FALSE(Has(result.message, "Input"));
}

TEST(ErrorClassifierTest, SyntaxErrorShowsExcerpt) {
    FailureContext context;
    context.source = "def f(x):\n    y = (x +\n    return y\n";
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::DefinitionFailure("SyntaxError", "invalid syntax", 3, 5), context);
    EXPECT_EQ(result.category, Category::kDefinitionFailure);
    EXPECT_FALSE(result.runtime_kind);
    EXPECT_TRUE(Has(result.message, "❌ Syntax Error"));
    EXPECT_TRUE(Has(result.message, "📍 Error at line 3, column 5: invalid syntax"));
    EXPECT_TRUE(Has(result.message, "  2:     y = (x +"));
    EXPECT_TRUE(Has(result.message, "→ 3:     return y"));
    EXPECT_FALSE(Has(result.message, "1: def"));
}

TEST(ErrorClassifierTest, IndentationError) {
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::DefinitionFailure("IndentationError", "unexpected indent", 2), FailureContext{});
    EXPECT_EQ(result.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(result.message, "❌ Indentation Error: unexpected indent (line 2)"));
}

TEST(ErrorClassifierTest, UnsupportedFeatureHasItsOwnTemplate) {
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::DefinitionFailure("UnsupportedFeature", "'with' statements are not supported", 4),
        FailureContext{});
    EXPECT_EQ(result.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(result.message, "❌ Unsupported Feature"));
    EXPECT_TRUE(Has(result.message, "📍 Line 4: 'with' statements are not supported"));
    EXPECT_FALSE(Has(result.message, "Syntax Error"));
    EXPECT_FALSE(Has(result.message, "missing colons"));
}

TEST(ErrorClassifierTest, DefinitionRuntimeError) {
    const auto result = ErrorClassifier::Classify(
        ExecutionOutcome::DefinitionFailure("NameError", "name 'y' is not defined", 1), FailureContext{});
    EXPECT_EQ(result.category, Category::kDefinitionFailure);
    EXPECT_TRUE(Has(result.message, "❌ Error while defining your code:"));
    EXPECT_TRUE(Has(result.message, "`NameError: name 'y' is not defined`"));
}

TEST(ErrorClassifierTest, TimeoutNamesDeadlineAndInput) {
    FailureContext context;
    context.input = "(10,)";
    auto result = ErrorClassifier::Classify(ExecutionOutcome::Timeout(), context);
    EXPECT_EQ(result.category, Category::kTimeout);
    EXPECT_TRUE(Has(result.message, "❌ Time Limit Exceeded: Execution exceeded 5 seconds"));
    EXPECT_TRUE(Has(result.message, "`(10,)`"));

    context.input.clear();
    context.deadline = std::chrono::milliseconds(250);
    result = ErrorClassifier::Classify(ExecutionOutcome::Timeout(), context);
    EXPECT_TRUE(Has(result.message, "250 ms while defining your code"));
}

TEST(ErrorClassifierTest, InternalErrorHidesDetail) {
    const auto result =
        ErrorClassifier::Classify(ExecutionOutcome::InternalError("worker exited abnormally"), FailureContext{});
    EXPECT_EQ(result.category, Category::kInternalError);
    EXPECT_FALSE(Has(result.message, "worker"));
}

TEST(ErrorClassifierTest, ValueMismatchNotesTypeDifference) {
    const auto message = FormatValueMismatch("(2, 3)", lang::Value::Int(5), lang::Value::Str("5"));
    EXPECT_TRUE(Has(message, "❌ Test Case Failed"));
    EXPECT_TRUE(Has(message, "✅ **Expected:** `5`"));
    EXPECT_TRUE(Has(message, "❌ **Got:** `'5'`"));
    EXPECT_TRUE(Has(message, "Expected `int`, got `str`"));

    const auto same_type = FormatValueMismatch("(2, 3)", lang::Value::Int(5), lang::Value::Int(6));
    EXPECT_FALSE(Has(same_type, "Type mismatch"));
}

TEST(ErrorClassifierTest, NameResolutionListsFoundCallables) {
    const auto message = FormatNameResolutionFailure("add", {"ad", "helper"});
    EXPECT_TRUE(Has(message, "❌ Expected function: `add`"));
    EXPECT_TRUE(Has(message, "📝 Found: `ad, helper`"));
    EXPECT_FALSE(Has(FormatNameResolutionFailure("add", {}), "Found"));
}

TEST(ErrorClassifierTest, RenderingIsBounded) {
    const auto long_list = lang::Value::List(std::vector<lang::Value>(500, lang::Value::Int(1)));
    EXPECT_LE(RenderValue(long_list).size(), 203u);
    EXPECT_EQ(RenderInputs({lang::Value::Int(2), lang::Value::Int(3)}), "(2, 3)");
    EXPECT_EQ(RenderInputs({lang::Value::Int(2)}), "(2,)");
}

TEST(ErrorClassifierTest, DeeplyNestedValueRendersPlaceholder) {
    auto nested = lang::Value::List();
    for (int i = 0; i < 2000; ++i) {
        nested = lang::Value::List({nested});
    }
    EXPECT_EQ(RenderValue(nested), "<list value that cannot be displayed: RecursionError>");
}

}  // namespace
}  // namespace evalbox::judge
