#include "judge/test_harness.hpp"

#include "judge/error_classifier.hpp"
#include "lang/parser.hpp"
#include "lang/script_error.hpp"
#include "security/security_filter.hpp"
#include "security/structural_check.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace evalbox::judge {
namespace {

EvaluationVerdict Failed(Category category, std::string message, std::size_t cases_passed) {
    EvaluationVerdict verdict;
    verdict.category = category;
    verdict.message = std::move(message);
    verdict.cases_passed = cases_passed;
    return verdict;
}

EvaluationVerdict FromClassification(const Classification& classification,
                                     const sandbox::ExecutionOutcome& outcome,
                                     std::size_t cases_passed) {
    auto verdict = Failed(classification.category, classification.message, cases_passed);
    verdict.runtime_kind = classification.runtime_kind;
    if (classification.category == Category::kRuntimeFailure) {
        verdict.error_kind = outcome.error_kind;
    }
    return verdict;
}

void LogViolation(const char* stage, const security::SecurityViolation& violation) {
    utils::Log(utils::LogLevel::kInfo, "filter", "submission rejected",
               {{"stage", stage}, {"construct", violation.construct}, {"line", std::to_string(violation.line)}});
}

void LogState(const char* state, const Submission& submission) {
    utils::Log(utils::LogLevel::kDebug, "harness", "state", {{"state", state}, {"target", submission.target_name}});
}

}  // namespace

HarnessOptions OptionsFromConfig(const config::Config& config) {
    HarnessOptions options;
    if (!sandbox::ParseIsolation(config.sandbox.isolation, options.session.isolation)) {
        utils::Log(utils::LogLevel::kWarn, "harness", "unknown isolation, using thread",
                   {{"isolation", config.sandbox.isolation}});
    }
    options.session.worker_path = config.sandbox.worker_path;
    options.session.memory_limit_mb = static_cast<std::uint64_t>(config.sandbox.memory_limit_mb);
    options.session.limits.max_call_depth = config.limits.max_call_depth;
    options.session.limits.max_container_size = static_cast<std::size_t>(config.limits.max_container_size);
    options.session.environment.max_output_bytes = static_cast<std::size_t>(config.limits.max_output_bytes);
    options.case_deadline = std::chrono::milliseconds(config.sandbox.timeout_ms);
    return options;
}

TestHarness::TestHarness(HarnessOptions options, std::shared_ptr<VerdictCache> cache)
    : options_(std::move(options)), cache_(std::move(cache)) {}

EvaluationVerdict TestHarness::Evaluate(const Submission& submission, const std::vector<TestCase>& cases) const {
    const auto started = std::chrono::steady_clock::now();
    std::string key;
    EvaluationVerdict verdict;
    try {
        if (cache_) {
            key = CacheKey(submission, cases, options_.case_deadline, sandbox::ToString(options_.session.isolation));
            if (auto cached = cache_->Lookup(key)) {
                utils::Log(utils::LogLevel::kDebug, "cache", "hit", {{"target", submission.target_name}});
                return *cached;
            }
        }
        verdict = Run(submission, cases);
    } catch (const std::exception& ex) {
        utils::Log(utils::LogLevel::kError, "harness", "internal error", {{"error", ex.what()}});
        return Failed(Category::kInternalError, FormatInternalError(), 0);
    }

    utils::Log(utils::LogLevel::kInfo, "harness", "verdict",
               {{"category", ToString(verdict.category)},
                {"target", submission.target_name},
                {"cases", std::to_string(cases.size())},
                {"passed_cases", std::to_string(verdict.cases_passed)},
                {"source_bytes", std::to_string(submission.source.size())},
                {"elapsed_ms", std::to_string(utils::ElapsedMs(started))}});
    if (cache_ && verdict.category != Category::kInternalError) {
        cache_->Store(key, verdict);
    }
    return verdict;
}

EvaluationVerdict TestHarness::Run(const Submission& submission, const std::vector<TestCase>& cases) const {
    FailureContext context;
    context.source = submission.source;
    context.deadline = options_.case_deadline;

    LogState("FILTERING", submission);
    if (auto violation = security::SecurityFilter().Check(submission.source)) {
        LogViolation("lexical", *violation);
        return Failed(Category::kSecurityViolation, FormatSecurityViolation(violation->reason), 0);
    }

    LogState("DEFINING", submission);
    std::unique_ptr<lang::Program> program;
    try {
        program = lang::ParseSource(submission.source);
    } catch (const lang::SyntaxError& ex) {
        const auto outcome =
            sandbox::ExecutionOutcome::DefinitionFailure(ex.kind(), ex.message(), ex.line(), ex.column());
        return FromClassification(ErrorClassifier::Classify(outcome, context), outcome, 0);
    }
    if (auto violation = security::StructuralChecker().Check(*program)) {
        LogViolation("structural", *violation);
        return Failed(Category::kSecurityViolation, FormatSecurityViolation(violation->reason), 0);
    }
    program.reset();

    auto session = sandbox::CreateSession(options_.session, submission.source);
    const auto defined = session->Define(options_.case_deadline);
    if (!defined.ok()) {
        return FromClassification(ErrorClassifier::Classify(defined, context), defined, 0);
    }

    LogState("RESOLVING", submission);
    if (!session->HasCallable(submission.target_name)) {
        return Failed(Category::kNameResolutionFailure,
                      FormatNameResolutionFailure(submission.target_name, session->Callables()), 0);
    }

    LogState("RUNNING", submission);
    std::size_t passed = 0;
    for (const auto& test_case : cases) {
        context.input = RenderInputs(test_case.inputs);
        const auto outcome = session->Call(submission.target_name, test_case.inputs, options_.case_deadline);
        if (!outcome.ok()) {
            return FromClassification(ErrorClassifier::Classify(outcome, context), outcome, passed);
        }
        if (outcome.value.IsNone()) {
            if (!outcome.output.empty()) {
                return Failed(Category::kOutputInsteadOfReturn, FormatOutputInsteadOfReturn(), passed);
            }
            return Failed(Category::kMissingReturn, FormatMissingReturn(), passed);
        }
        bool matches = false;
        try {
            matches = lang::Equals(outcome.value, test_case.expected);
        } catch (const lang::ScriptException& ex) {
            // Comparing values nested past the comparison limit.
            const auto failure = sandbox::ExecutionOutcome::RuntimeFailure(ex.TypeName(), ex.Message());
            return FromClassification(ErrorClassifier::Classify(failure, context), failure, passed);
        }
        if (!matches) {
            auto verdict = Failed(Category::kValueMismatch,
                                  FormatValueMismatch(context.input, test_case.expected, outcome.value), passed);
            verdict.type_mismatch = lang::TypeName(outcome.value) != lang::TypeName(test_case.expected);
            return verdict;
        }
        ++passed;
    }

    EvaluationVerdict verdict;
    verdict.passed = true;
    verdict.category = Category::kPassed;
    verdict.message = FormatPassed(cases.size());
    verdict.cases_passed = passed;
    return verdict;
}

EvaluationVerdict Evaluate(const std::string& source_text,
                           const std::string& target_name,
                           const std::vector<TestCase>& test_cases) {
    return TestHarness().Evaluate(Submission{source_text, target_name}, test_cases);
}

}  // namespace evalbox::judge
