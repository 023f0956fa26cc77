#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <map>
#include <mutex>

namespace evalbox::utils {
namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::kInfo)};
std::mutex g_output_mutex;

}  // namespace

bool ParseLogLevel(const std::string& text, LogLevel& level) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        level = LogLevel::kDebug;
    } else if (lowered == "info") {
        level = LogLevel::kInfo;
    } else if (lowered == "warn" || lowered == "warning") {
        level = LogLevel::kWarn;
    } else if (lowered == "error") {
        level = LogLevel::kError;
    } else {
        return false;
    }
    return true;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level = static_cast<int>(config.min_level);
}

LogLevel MinLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

void Log(const LogMessage& message) {
    if (static_cast<int>(message.level) < g_min_level.load()) {
        return;
    }
    // Sorted so that lines are stable across runs.
    const std::map<std::string, std::string> sorted(message.fields.begin(), message.fields.end());
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << "[" << message.tag << "] ";
    if (message.level != LogLevel::kInfo) {
        std::cerr << ToString(message.level) << " ";
    }
    std::cerr << message.message;
    for (const auto& [key, value] : sorted) {
        std::cerr << " " << key << "=" << value;
    }
    std::cerr << std::endl;
}

}  // namespace evalbox::utils
