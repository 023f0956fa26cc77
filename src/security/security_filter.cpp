#include "security/security_filter.hpp"

#include <cctype>

namespace evalbox::security {
namespace {

SecurityRule ImportRule(const std::string& module) {
    return {R"(\bimport\s+)" + module + R"(\b)", module, "Importing '" + module + "' module is not allowed"};
}

SecurityRule CallRule(const std::string& name) {
    return {R"(\b)" + name + R"(\s*\()", name, "Using '" + name + "()' is not allowed"};
}

SecurityRule AttributeRule(const std::string& name) {
    return {R"(\.)" + name, name, "Accessing '" + name + "' is not allowed"};
}

// Source with every whitespace run collapsed to one character, plus the
// source line of each remaining character. The rules only look at whether
// whitespace is present, so matches are unchanged, while libstdc++'s
// recursive matcher never sees a run longer than one.
struct CompactSource {
    std::string text;
    std::vector<int> lines;
};

CompactSource Compact(const std::string& source) {
    CompactSource compact;
    compact.text.reserve(source.size());
    compact.lines.reserve(source.size());
    int line = 1;
    std::size_t i = 0;
    while (i < source.size()) {
        if (!std::isspace(static_cast<unsigned char>(source[i]))) {
            compact.text.push_back(source[i]);
            compact.lines.push_back(line);
            ++i;
            continue;
        }
        const int first_line = line;
        bool newline = false;
        while (i < source.size() && std::isspace(static_cast<unsigned char>(source[i]))) {
            if (source[i] == '\n') {
                ++line;
                newline = true;
            }
            ++i;
        }
        compact.text.push_back(newline ? '\n' : ' ');
        compact.lines.push_back(first_line);
    }
    return compact;
}

}  // namespace

const std::vector<SecurityRule>& SecurityFilter::Rules() {
    static const std::vector<SecurityRule> kRules = {
        ImportRule("os"),
        ImportRule("sys"),
        ImportRule("subprocess"),
        {R"(\bopen\s*\()", "open", "File operations with 'open()' are not allowed"},
        CallRule("eval"),
        CallRule("exec"),
        CallRule("__import__"),
        CallRule("compile"),
        CallRule("globals"),
        CallRule("locals"),
        CallRule("getattr"),
        CallRule("setattr"),
        CallRule("delattr"),
        AttributeRule("__class__"),
        AttributeRule("__bases__"),
        AttributeRule("__subclasses__"),
        AttributeRule("__code__"),
        AttributeRule("__globals__"),
        AttributeRule("__builtins__"),
    };
    return kRules;
}

SecurityFilter::SecurityFilter() {
    for (const auto& rule : Rules()) {
        compiled_.emplace_back(rule.pattern, std::regex::ECMAScript | std::regex::optimize);
    }
}

std::optional<SecurityViolation> SecurityFilter::Check(const std::string& source) const {
    const auto& rules = Rules();
    const auto compact = Compact(source);
    for (std::size_t i = 0; i < compiled_.size(); ++i) {
        std::smatch match;
        if (!std::regex_search(compact.text, match, compiled_[i])) {
            continue;
        }
        SecurityViolation violation;
        violation.reason = rules[i].reason;
        violation.construct = rules[i].construct;
        violation.line = compact.lines[static_cast<std::size_t>(match.position(0))];
        return violation;
    }
    return std::nullopt;
}

}  // namespace evalbox::security
