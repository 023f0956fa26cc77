#include "sandbox/environment.hpp"

#include "sandbox/builtins.hpp"

namespace evalbox::sandbox {

OutputSink::OutputSink(std::size_t max_bytes) : max_bytes_(max_bytes) {}

void OutputSink::Write(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (buffer_.size() >= max_bytes_) {
        truncated_ = truncated_ || !text.empty();
        return;
    }
    const auto room = max_bytes_ - buffer_.size();
    if (text.size() > room) {
        buffer_.append(text, 0, room);
        truncated_ = true;
        return;
    }
    buffer_ += text;
}

std::string OutputSink::Contents() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_;
}

bool OutputSink::Empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.empty() && !truncated_;
}

bool OutputSink::Truncated() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return truncated_;
}

void OutputSink::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    buffer_.clear();
    truncated_ = false;
}

EnvironmentBuilder::EnvironmentBuilder(EnvironmentOptions options) : options_(std::move(options)) {}

Environment EnvironmentBuilder::Build() const {
    Environment env;
    env.output = std::make_shared<OutputSink>(options_.max_output_bytes);
    RegisterConstructors(env.builtins);
    RegisterFunctions(env.builtins);
    RegisterExceptionTypes(env.builtins);
    RegisterPrint(env.builtins, env.output);
    for (const auto& [name, fn] : options_.extra_builtins) {
        env.builtins[name] = MakeBuiltin(name, fn);
    }
    return env;
}

const std::vector<std::string>& EnvironmentBuilder::AllowedNames() {
    static const std::vector<std::string> kNames = [] {
        std::vector<std::string> names = ConstructorNames();
        names.insert(names.end(), FunctionNames().begin(), FunctionNames().end());
        names.push_back("print");
        names.insert(names.end(), ExceptionTypeNames().begin(), ExceptionTypeNames().end());
        return names;
    }();
    return kNames;
}

}  // namespace evalbox::sandbox
