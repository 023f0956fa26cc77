#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "lang/value.hpp"

namespace evalbox::sandbox {

// Collects what the submission prints. Bytes past the cap are dropped.
class OutputSink {
public:
    explicit OutputSink(std::size_t max_bytes = 64 * 1024);

    void Write(const std::string& text);
    std::string Contents() const;
    bool Empty() const;
    bool Truncated() const;
    void Clear();

private:
    const std::size_t max_bytes_;
    mutable std::mutex mutex_;
    std::string buffer_;
    bool truncated_ = false;
};

// Builtin table for one interpreter plus the sink its print() writes to.
struct Environment {
    std::unordered_map<std::string, lang::Value> builtins;
    std::shared_ptr<OutputSink> output;
};

struct EnvironmentOptions {
    std::size_t max_output_bytes = 64 * 1024;
    // Additional builtins, registered after the allow-list. Used by embedders
    // and tests to observe what a submission can reach.
    std::unordered_map<std::string, lang::BuiltinCallable> extra_builtins;
};

class EnvironmentBuilder {
public:
    explicit EnvironmentBuilder(EnvironmentOptions options = {});

    // Fresh tables and a fresh sink on every call.
    Environment Build() const;

    static const std::vector<std::string>& AllowedNames();

private:
    EnvironmentOptions options_;
};

}  // namespace evalbox::sandbox
