#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace evalbox::security {

struct SecurityViolation {
    // Human-readable, always names the construct: "Using 'eval()' is not allowed".
    std::string reason;
    std::string construct;
    int line = 0;
};

struct SecurityRule {
    std::string pattern;
    std::string construct;
    std::string reason;
};

// Ordered lexical rules applied to the raw source before it is parsed.
// The first matching rule wins.
class SecurityFilter {
public:
    SecurityFilter();

    std::optional<SecurityViolation> Check(const std::string& source) const;

    static const std::vector<SecurityRule>& Rules();

private:
    std::vector<std::regex> compiled_;
};

}  // namespace evalbox::security
