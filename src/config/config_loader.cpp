#include "config/config_loader.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <string>
#include <system_error>

#include <nlohmann/json.hpp>

#include "utils/logging.hpp"

namespace evalbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

void Reject(const std::string& key, const std::string& value) {
    utils::Log(utils::LogLevel::kWarn, "config", "ignoring invalid value", {{"key", key}, {"value", value}});
}

bool ValidIsolation(const std::string& value) {
    return value == "thread" || value == "process";
}

bool ParseBool(const std::string& value, bool& out) {
    std::string lowered;
    for (const unsigned char c : value) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

bool ParseInt64(const std::string& value, std::int64_t& out) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Positive integers only; everything else keeps the previous value.
template <typename T>
void ApplyPositive(const std::string& key, const std::string& text, T& target) {
    std::int64_t parsed = 0;
    if (!ParseInt64(text, parsed) || parsed <= 0 || parsed > std::numeric_limits<T>::max()) {
        Reject(key, text);
        return;
    }
    target = static_cast<T>(parsed);
}

template <typename T>
void ApplyPositiveJson(const std::string& key, const nlohmann::json& section, const char* name, T& target) {
    if (!section.contains(name)) {
        return;
    }
    const auto& value = section[name];
    if (!value.is_number_integer() || value.get<std::int64_t>() <= 0 ||
        value.get<std::int64_t>() > std::numeric_limits<T>::max()) {
        Reject(key, value.dump());
        return;
    }
    target = static_cast<T>(value.get<std::int64_t>());
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        if (sandbox.contains("isolation") && sandbox["isolation"].is_string()) {
            const auto isolation = sandbox["isolation"].get<std::string>();
            if (ValidIsolation(isolation)) {
                config.sandbox.isolation = isolation;
            } else {
                Reject("sandbox.isolation", isolation);
            }
        }
        ApplyPositiveJson("sandbox.timeoutMs", sandbox, "timeoutMs", config.sandbox.timeout_ms);
        if (sandbox.contains("workerPath") && sandbox["workerPath"].is_string()) {
            config.sandbox.worker_path = sandbox["workerPath"].get<std::string>();
        }
        ApplyPositiveJson("sandbox.memoryLimitMb", sandbox, "memoryLimitMb", config.sandbox.memory_limit_mb);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ApplyPositiveJson("limits.maxCallDepth", limits, "maxCallDepth", config.limits.max_call_depth);
        ApplyPositiveJson("limits.maxContainerSize", limits, "maxContainerSize", config.limits.max_container_size);
        ApplyPositiveJson("limits.maxOutputBytes", limits, "maxOutputBytes", config.limits.max_output_bytes);
    }

    if (data.contains("cache") && data["cache"].is_object()) {
        const auto& cache = data["cache"];
        if (cache.contains("enabled") && cache["enabled"].is_boolean()) {
            config.cache.enabled = cache["enabled"].get<bool>();
        }
        ApplyPositiveJson("cache.capacity", cache, "capacity", config.cache.capacity);
    }

    if (data.contains("log") && data["log"].is_object()) {
        const auto& log = data["log"];
        if (log.contains("level") && log["level"].is_string()) {
            const auto level = log["level"].get<std::string>();
            if (!utils::ParseLogLevel(level, config.log.level)) {
                Reject("log.level", level);
            }
        }
    }
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = GetEnv("EVALBOX_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return GetHomePath() / ".evalbox" / "config.json";
}

std::filesystem::path DefaultWorkerPath() {
    std::error_code ec;
    const auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::filesystem::path("evalbox-worker");
    }
    return self.parent_path() / "evalbox-worker";
}

Config LoadConfig() {
    Config config{};

    const auto config_path = GetConfigPath();
    std::error_code exists_ec;
    if (std::filesystem::exists(config_path, exists_ec)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            config = Config{};
            utils::Log(utils::LogLevel::kWarn, "config", "failed to parse config, using defaults",
                       {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }

    const auto isolation = GetEnvFallback("EVALBOX_SANDBOX__ISOLATION", "EVALBOX_SANDBOX_ISOLATION");
    if (!isolation.empty()) {
        if (ValidIsolation(isolation)) {
            config.sandbox.isolation = isolation;
        } else {
            Reject("EVALBOX_SANDBOX__ISOLATION", isolation);
        }
    }

    const auto timeout_ms = GetEnvFallback("EVALBOX_SANDBOX__TIMEOUT_MS", "EVALBOX_SANDBOX_TIMEOUT_MS");
    if (!timeout_ms.empty()) {
        ApplyPositive("EVALBOX_SANDBOX__TIMEOUT_MS", timeout_ms, config.sandbox.timeout_ms);
    }

    const auto worker_path = GetEnvFallback("EVALBOX_SANDBOX__WORKER_PATH", "EVALBOX_SANDBOX_WORKER_PATH");
    if (!worker_path.empty()) {
        config.sandbox.worker_path = worker_path;
    }

    const auto memory_limit = GetEnvFallback("EVALBOX_SANDBOX__MEMORY_LIMIT_MB", "EVALBOX_SANDBOX_MEMORY_LIMIT_MB");
    if (!memory_limit.empty()) {
        ApplyPositive("EVALBOX_SANDBOX__MEMORY_LIMIT_MB", memory_limit, config.sandbox.memory_limit_mb);
    }

    const auto call_depth = GetEnvFallback("EVALBOX_LIMITS__MAX_CALL_DEPTH", "EVALBOX_LIMITS_MAX_CALL_DEPTH");
    if (!call_depth.empty()) {
        ApplyPositive("EVALBOX_LIMITS__MAX_CALL_DEPTH", call_depth, config.limits.max_call_depth);
    }

    const auto container_size =
        GetEnvFallback("EVALBOX_LIMITS__MAX_CONTAINER_SIZE", "EVALBOX_LIMITS_MAX_CONTAINER_SIZE");
    if (!container_size.empty()) {
        ApplyPositive("EVALBOX_LIMITS__MAX_CONTAINER_SIZE", container_size, config.limits.max_container_size);
    }

    const auto output_bytes = GetEnvFallback("EVALBOX_LIMITS__MAX_OUTPUT_BYTES", "EVALBOX_LIMITS_MAX_OUTPUT_BYTES");
    if (!output_bytes.empty()) {
        ApplyPositive("EVALBOX_LIMITS__MAX_OUTPUT_BYTES", output_bytes, config.limits.max_output_bytes);
    }

    const auto cache_enabled = GetEnvFallback("EVALBOX_CACHE__ENABLED", "EVALBOX_CACHE_ENABLED");
    if (!cache_enabled.empty() && !ParseBool(cache_enabled, config.cache.enabled)) {
        Reject("EVALBOX_CACHE__ENABLED", cache_enabled);
    }

    const auto cache_capacity = GetEnvFallback("EVALBOX_CACHE__CAPACITY", "EVALBOX_CACHE_CAPACITY");
    if (!cache_capacity.empty()) {
        ApplyPositive("EVALBOX_CACHE__CAPACITY", cache_capacity, config.cache.capacity);
    }

    const auto log_level = GetEnvFallback("EVALBOX_LOG__LEVEL", "EVALBOX_LOG_LEVEL");
    if (!log_level.empty() && !utils::ParseLogLevel(log_level, config.log.level)) {
        Reject("EVALBOX_LOG__LEVEL", log_level);
    }

    if (config.sandbox.worker_path.empty()) {
        config.sandbox.worker_path = DefaultWorkerPath().string();
    }
    return config;
}

}  // namespace evalbox::config
