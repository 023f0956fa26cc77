#pragma once

#include <string>
#include <vector>

#include "lang/value.hpp"

namespace evalbox::judge {

struct Submission {
    std::string source;
    std::string target_name;
};

struct TestCase {
    std::vector<lang::Value> inputs;
    lang::Value expected;
};

}  // namespace evalbox::judge
