#pragma once
// =============================================================================
// PrinterHub Config Loader
// =============================================================================
// Loads EngineConfig from a JSON file with nlohmann/json. The resulting struct
// is immutable from the engine's point of view: each component copies the
// section it needs at construction and never reads ambient state afterwards.
// =============================================================================

#include <string>
#include <fstream>
#include <nlohmann/json.hpp>
#include "printerhub_log.hpp"
#include "result.hpp"

namespace printerhub {
namespace config {

enum class ReconnectPolicy {
    Reject,   // second createContext for a connected device fails
    Replace,  // old context is removed, a fresh one is created
};

inline const char* reconnectPolicyName(ReconnectPolicy p) {
    return p == ReconnectPolicy::Replace ? "replace" : "reject";
}

struct PollingConfig {
    int active_interval_ms = 3000;
    int inactive_interval_ms = 30000;
    int max_retries = 3;            // extra attempts within one tick
    int retry_delay_ms = 1000;      // multiplied by attempt number
    bool auto_start = true;         // start a loop on context-created
    bool emit_cached_on_promote = true;
};

struct PortConfig {
    int start_port = 8181;
    int end_port = 8191;
};

struct QueueConfig {
    int legacy_concurrency = 1;     // single shared TCP channel
    int modern_concurrency = 4;
    int max_retries = 3;
    int retry_base_delay_ms = 500;  // doubled per attempt
    int request_timeout_ms = 30000;
    int max_pending_per_context = 256;
};

struct ContextConfig {
    ReconnectPolicy reconnect_policy = ReconnectPolicy::Reject;
    bool auto_activate_first = true;
};

struct LogConfig {
    std::string level = "info";
    std::string log_path;           // empty = console only
};

struct EngineConfig {
    PollingConfig polling;
    PortConfig ports;
    QueueConfig queue;
    ContextConfig contexts;
    LogConfig log;
};

// Section/key accessor. Missing keys yield the default; a present key of the
// wrong type throws nlohmann::json::type_error (reported by parseConfig).
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    if (j.contains(section) && j[section].is_object() && j[section].contains(key)) {
        return j[section][key].get<T>();
    }
    return def;
}

inline Result<void> validateConfig(const EngineConfig& cfg) {
    auto invalid = [](const std::string& msg) {
        return Result<void>(Error(ErrorKind::InvalidArgument, msg));
    };
    if (cfg.polling.active_interval_ms <= 0 || cfg.polling.inactive_interval_ms <= 0)
        return invalid("polling intervals must be positive");
    if (cfg.polling.inactive_interval_ms < cfg.polling.active_interval_ms)
        return invalid("inactive_interval_ms must not be shorter than active_interval_ms");
    if (cfg.polling.max_retries < 0 || cfg.polling.retry_delay_ms < 0)
        return invalid("polling retry settings must be non-negative");
    if (cfg.ports.start_port < 1 || cfg.ports.end_port > 65535)
        return invalid("port numbers must be in range 1-65535");
    if (cfg.ports.start_port > cfg.ports.end_port)
        return invalid("invalid port range: start_port > end_port");
    if (cfg.queue.legacy_concurrency != 1)
        return invalid("legacy_concurrency must be 1 (shared protocol channel)");
    if (cfg.queue.modern_concurrency < 2)
        return invalid("modern_concurrency must be at least 2");
    if (cfg.queue.max_retries < 0 || cfg.queue.retry_base_delay_ms < 0)
        return invalid("queue retry settings must be non-negative");
    if (cfg.queue.request_timeout_ms <= 0)
        return invalid("request_timeout_ms must be positive");
    if (cfg.queue.max_pending_per_context <= 0)
        return invalid("max_pending_per_context must be positive");
    return Ok();
}

inline Result<EngineConfig> parseConfig(const nlohmann::json& j) {
    EngineConfig config;
    const EngineConfig def;
    try {
        config.polling.active_interval_ms = jsonGet<int>(j, "polling", "active_interval_ms", def.polling.active_interval_ms);
        config.polling.inactive_interval_ms = jsonGet<int>(j, "polling", "inactive_interval_ms", def.polling.inactive_interval_ms);
        config.polling.max_retries = jsonGet<int>(j, "polling", "max_retries", def.polling.max_retries);
        config.polling.retry_delay_ms = jsonGet<int>(j, "polling", "retry_delay_ms", def.polling.retry_delay_ms);
        config.polling.auto_start = jsonGet<bool>(j, "polling", "auto_start", def.polling.auto_start);
        config.polling.emit_cached_on_promote = jsonGet<bool>(j, "polling", "emit_cached_on_promote", def.polling.emit_cached_on_promote);

        config.ports.start_port = jsonGet<int>(j, "ports", "start_port", def.ports.start_port);
        config.ports.end_port = jsonGet<int>(j, "ports", "end_port", def.ports.end_port);

        config.queue.legacy_concurrency = jsonGet<int>(j, "queue", "legacy_concurrency", def.queue.legacy_concurrency);
        config.queue.modern_concurrency = jsonGet<int>(j, "queue", "modern_concurrency", def.queue.modern_concurrency);
        config.queue.max_retries = jsonGet<int>(j, "queue", "max_retries", def.queue.max_retries);
        config.queue.retry_base_delay_ms = jsonGet<int>(j, "queue", "retry_base_delay_ms", def.queue.retry_base_delay_ms);
        config.queue.request_timeout_ms = jsonGet<int>(j, "queue", "request_timeout_ms", def.queue.request_timeout_ms);
        config.queue.max_pending_per_context = jsonGet<int>(j, "queue", "max_pending_per_context", def.queue.max_pending_per_context);

        std::string policy = jsonGet<std::string>(j, "contexts", "reconnect_policy", "reject");
        if (policy == "replace") {
            config.contexts.reconnect_policy = ReconnectPolicy::Replace;
        } else if (policy == "reject") {
            config.contexts.reconnect_policy = ReconnectPolicy::Reject;
        } else {
            return Err<EngineConfig>(ErrorKind::InvalidArgument,
                                     "unknown reconnect_policy: " + policy);
        }
        config.contexts.auto_activate_first = jsonGet<bool>(j, "contexts", "auto_activate_first", def.contexts.auto_activate_first);

        config.log.level = jsonGet<std::string>(j, "log", "level", def.log.level);
        config.log.log_path = jsonGet<std::string>(j, "log", "log_path", def.log.log_path);
    } catch (const nlohmann::json::exception& e) {
        return Err<EngineConfig>(ErrorKind::InvalidArgument,
                                 std::string("config type error: ") + e.what());
    }

    auto valid = validateConfig(config);
    if (valid.is_err()) return valid.error();
    return config;
}

// Missing file -> defaults (with a warning). Malformed or invalid -> error.
inline Result<EngineConfig> loadConfig(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        PHLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return EngineConfig{};
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        PHLOG_ERROR("config", "JSON parse error: %s", e.what());
        return Err<EngineConfig>(ErrorKind::InvalidArgument,
                                 std::string("JSON parse error: ") + e.what());
    }

    auto result = parseConfig(j);
    if (result.is_ok()) {
        const auto& cfg = result.value();
        PHLOG_INFO("config", "Loaded: polling=%d/%dms ports=%d-%d queue=%d/%d policy=%s",
                   cfg.polling.active_interval_ms, cfg.polling.inactive_interval_ms,
                   cfg.ports.start_port, cfg.ports.end_port,
                   cfg.queue.legacy_concurrency, cfg.queue.modern_concurrency,
                   reconnectPolicyName(cfg.contexts.reconnect_policy));
    } else {
        PHLOG_ERROR("config", "%s", result.error().message.c_str());
    }
    return result;
}

} // namespace config
} // namespace printerhub
