#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "judge/test_case.hpp"
#include "judge/verdict.hpp"
#include "judge/verdict_cache.hpp"
#include "sandbox/execution_session.hpp"

namespace evalbox::judge {

struct HarnessOptions {
    sandbox::SessionConfig session;
    // Applies to the definition run and to every test case.
    std::chrono::milliseconds case_deadline{5000};
};

HarnessOptions OptionsFromConfig(const config::Config& config);

// Fail-fast evaluation of one submission:
// FILTERING -> DEFINING -> RESOLVING -> RUNNING.
// Evaluate() is safe to call concurrently; every call owns its filter pass,
// environment and session.
class TestHarness {
public:
    explicit TestHarness(HarnessOptions options = {}, std::shared_ptr<VerdictCache> cache = nullptr);

    EvaluationVerdict Evaluate(const Submission& submission, const std::vector<TestCase>& cases) const;

    const HarnessOptions& options() const { return options_; }

private:
    EvaluationVerdict Run(const Submission& submission, const std::vector<TestCase>& cases) const;

    HarnessOptions options_;
    std::shared_ptr<VerdictCache> cache_;
};

// Evaluates with default options.
EvaluationVerdict Evaluate(const std::string& source_text,
                           const std::string& target_name,
                           const std::vector<TestCase>& test_cases);

}  // namespace evalbox::judge
