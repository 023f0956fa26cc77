#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/config_loader.hpp"
#include "judge/case_loader.hpp"
#include "judge/error_classifier.hpp"
#include "judge/test_harness.hpp"
#include "judge/verdict_cache.hpp"
#include "lang/parser.hpp"
#include "lang/script_error.hpp"
#include "sandbox/outcome.hpp"
#include "security/security_filter.hpp"
#include "security/structural_check.hpp"
#include "utils/logging.hpp"

#ifndef EVALBOX_VERSION
#define EVALBOX_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void PrintUsage() {
    std::cerr << "Usage: evalbox evaluate [--json] <request.json>\n"
              << "       evalbox check <source-file>\n"
              << "       evalbox check --rules\n"
              << "       evalbox version" << std::endl;
}

bool ReadFile(const std::string& path, std::string& contents) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return false;
    }
    std::ostringstream stream;
    stream << input.rdbuf();
    contents = stream.str();
    return true;
}

int RunEvaluate(const std::vector<std::string>& args, const evalbox::config::Config& config) {
    bool json_output = false;
    std::string path;
    for (const auto& arg : args) {
        if (arg == "--json") {
            json_output = true;
        } else if (path.empty()) {
            path = arg;
        } else {
            PrintUsage();
            return kExitUsage;
        }
    }
    if (path.empty()) {
        PrintUsage();
        return kExitUsage;
    }

    evalbox::judge::EvaluationRequest request;
    try {
        request = evalbox::judge::LoadRequestFile(path);
    } catch (const std::exception& ex) {
        std::cerr << "evalbox: " << ex.what() << std::endl;
        return kExitUsage;
    }

    std::shared_ptr<evalbox::judge::VerdictCache> cache;
    if (config.cache.enabled) {
        cache = std::make_shared<evalbox::judge::InMemoryVerdictCache>(static_cast<std::size_t>(config.cache.capacity));
    }
    const evalbox::judge::TestHarness harness(evalbox::judge::OptionsFromConfig(config), cache);
    const auto verdict = harness.Evaluate(request.submission, request.cases);

    if (json_output) {
        nlohmann::json out = {
            {"passed", verdict.passed},
            {"category", evalbox::judge::ToString(verdict.category)},
            {"message", verdict.message},
            {"casesPassed", verdict.cases_passed},
        };
        if (verdict.runtime_kind) {
            out["runtimeKind"] = evalbox::judge::ToString(*verdict.runtime_kind);
            out["errorKind"] = verdict.error_kind;
        }
        if (verdict.category == evalbox::judge::Category::kValueMismatch) {
            out["typeMismatch"] = verdict.type_mismatch;
        }
        std::cout << out.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cout << verdict.message << std::endl;
    }
    return verdict.passed ? kExitPassed : kExitFailed;
}

int RunCheck(const std::vector<std::string>& args) {
    if (args.size() != 1) {
        PrintUsage();
        return kExitUsage;
    }
    if (args[0] == "--rules") {
        for (const auto& rule : evalbox::security::SecurityFilter::Rules()) {
            std::cout << rule.pattern << "\t" << rule.reason << std::endl;
        }
        return kExitPassed;
    }

    std::string source;
    if (!ReadFile(args[0], source)) {
        std::cerr << "evalbox: cannot open " << args[0] << std::endl;
        return kExitUsage;
    }
    if (auto violation = evalbox::security::SecurityFilter().Check(source)) {
        std::cout << evalbox::judge::FormatSecurityViolation(violation->reason) << " (line " << violation->line
                  << ")" << std::endl;
        return kExitFailed;
    }
    std::unique_ptr<evalbox::lang::Program> program;
    try {
        program = evalbox::lang::ParseSource(source);
    } catch (const evalbox::lang::SyntaxError& ex) {
        const auto outcome = evalbox::sandbox::ExecutionOutcome::DefinitionFailure(ex.kind(), ex.message(),
                                                                                   ex.line(), ex.column());
        evalbox::judge::FailureContext context;
        context.source = source;
        std::cout << evalbox::judge::ErrorClassifier::Classify(outcome, context).message << std::endl;
        return kExitFailed;
    }
    if (auto violation = evalbox::security::StructuralChecker().Check(*program)) {
        std::cout << evalbox::judge::FormatSecurityViolation(violation->reason) << " (line " << violation->line
                  << ")" << std::endl;
        return kExitFailed;
    }
    std::cout << "✅ No forbidden constructs found" << std::endl;
    return kExitPassed;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    const std::vector<std::string> args(argv + 2, argv + argc);

    if (command == "version" || command == "--version") {
        std::cout << "evalbox " << EVALBOX_VERSION << std::endl;
        return kExitPassed;
    }

    const auto config = evalbox::config::LoadConfig();
    evalbox::utils::LogConfig log_config;
    log_config.min_level = config.log.level;
    evalbox::utils::ConfigureLogging(log_config);

    if (command == "evaluate") {
        return RunEvaluate(args, config);
    }
    if (command == "check") {
        return RunCheck(args);
    }
    PrintUsage();
    return kExitUsage;
}
