#pragma once

#include <cstdint>
#include <string>

#include "utils/logging.hpp"

namespace evalbox::config {

struct SandboxConfig {
    // "thread" or "process".
    std::string isolation = "thread";
    int timeout_ms = 5000;
    std::string worker_path;
    int memory_limit_mb = 256;
};

struct LimitsConfig {
    int max_call_depth = 200;
    std::int64_t max_container_size = 10000000;
    std::int64_t max_output_bytes = 64 * 1024;
};

struct CacheConfig {
    bool enabled = false;
    int capacity = 256;
};

struct LogSettings {
    utils::LogLevel level = utils::LogLevel::kInfo;
};

struct Config {
    SandboxConfig sandbox;
    LimitsConfig limits;
    CacheConfig cache;
    LogSettings log;
};

}  // namespace evalbox::config
