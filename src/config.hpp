#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace soulwire {

struct SoulOptions;

struct LoopConfig {
    uint32_t max_steps_per_run = 100;
    uint32_t max_retries_per_step = 3;
};

struct RetryConfig {
    uint32_t base_delay_ms = 300;
    uint32_t max_delay_ms = 5000;
    double jitter = 0.25;
};

struct ContextConfig {
    uint32_t max_context_size = 128000;
    double compaction_ratio = 0.85;
    uint32_t protected_tail = 10;
    std::string summarizer = "counting";  // or "provider"
};

struct Config {
    std::string provider = "echo";
    std::string model = "echo-1";
    double temperature = 0.7;

    // Raw per-provider settings, handed to provider factories as is
    std::unordered_map<std::string, nlohmann::json> providers;

    LoopConfig loop_control;
    RetryConfig retry;
    ContextConfig context;
    uint32_t subagent_max_depth = 2;
    bool yolo = false;
    uint32_t lock_timeout_ms = 5000;

    // Load <share_dir>/config.json (created with defaults when absent),
    // then apply environment overrides.
    static Config load();
    static Config load_from(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build from already merged JSON. Throws ConfigError on values out of range.
    static Config from_json(const nlohmann::json& j);

    // Engine options derived from this config.
    SoulOptions soul_options() const;

    // JSON config for a provider name (empty object if absent)
    nlohmann::json provider_config(const std::string& name) const;
};

// SOULWIRE_SHARE_DIR, or ~/.soulwire.
std::string share_dir();

// Add keys missing from `existing`, recursing into objects.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace soulwire
