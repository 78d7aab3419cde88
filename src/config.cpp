#include "config.hpp"
#include "errors.hpp"
#include "soul.hpp"
#include "util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

namespace soulwire {

std::string share_dir() {
    if (const char* v = std::getenv("SOULWIRE_SHARE_DIR")) {
        if (*v) return expand_home(v);
    }
    return expand_home("~/.soulwire");
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "echo"},
        {"model", "echo-1"},
        {"temperature", 0.7},
        {"providers", nlohmann::json::object()},
        {"loop_control", {
            {"max_steps_per_run", 100},
            {"max_retries_per_step", 3}
        }},
        {"retry", {
            {"base_delay_ms", 300},
            {"max_delay_ms", 5000},
            {"jitter", 0.25}
        }},
        {"context", {
            {"max_context_size", 128000},
            {"compaction_ratio", 0.85},
            {"protected_tail", 10},
            {"summarizer", "counting"}
        }},
        {"subagents", {
            {"max_depth", 2}
        }},
        {"approval", {
            {"yolo", false}
        }},
        {"session", {
            {"lock_timeout_ms", 5000}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_uint(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (!obj.contains(key) || !obj[key].is_number_integer()) return;
    auto v = obj[key].get<int64_t>();
    if (v < 0) throw ConfigError(std::string(key) + " must not be negative");
    out = static_cast<uint32_t>(v);
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static const nlohmann::json& section(const nlohmann::json& j, const char* key) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (j.contains(key) && j[key].is_object()) return j[key];
    return empty;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("provider") && j["provider"].is_string())
        cfg.provider = j["provider"].get<std::string>();
    if (j.contains("model") && j["model"].is_string())
        cfg.model = j["model"].get<std::string>();
    read_double(j, "temperature", cfg.temperature);

    for (auto& [name, obj] : section(j, "providers").items()) {
        if (obj.is_object()) cfg.providers[name] = obj;
    }

    const auto& loop = section(j, "loop_control");
    read_uint(loop, "max_steps_per_run", cfg.loop_control.max_steps_per_run);
    read_uint(loop, "max_retries_per_step", cfg.loop_control.max_retries_per_step);

    const auto& retry = section(j, "retry");
    read_uint(retry, "base_delay_ms", cfg.retry.base_delay_ms);
    read_uint(retry, "max_delay_ms", cfg.retry.max_delay_ms);
    read_double(retry, "jitter", cfg.retry.jitter);

    const auto& ctx = section(j, "context");
    read_uint(ctx, "max_context_size", cfg.context.max_context_size);
    read_double(ctx, "compaction_ratio", cfg.context.compaction_ratio);
    read_uint(ctx, "protected_tail", cfg.context.protected_tail);
    if (ctx.contains("summarizer") && ctx["summarizer"].is_string())
        cfg.context.summarizer = ctx["summarizer"].get<std::string>();

    read_uint(section(j, "subagents"), "max_depth", cfg.subagent_max_depth);

    const auto& approval = section(j, "approval");
    if (approval.contains("yolo") && approval["yolo"].is_boolean())
        cfg.yolo = approval["yolo"].get<bool>();

    read_uint(section(j, "session"), "lock_timeout_ms", cfg.lock_timeout_ms);

    if (cfg.loop_control.max_steps_per_run == 0)
        throw ConfigError("loop_control.max_steps_per_run must be at least 1");
    if (cfg.context.compaction_ratio <= 0.0 || cfg.context.compaction_ratio > 1.0)
        throw ConfigError("context.compaction_ratio must be in (0, 1]");
    if (cfg.context.protected_tail == 0)
        throw ConfigError("context.protected_tail must be at least 1");
    if (cfg.context.summarizer != "counting" && cfg.context.summarizer != "provider")
        throw ConfigError("context.summarizer must be \"counting\" or \"provider\"");
    if (cfg.retry.jitter < 0.0 || cfg.retry.jitter >= 1.0)
        throw ConfigError("retry.jitter must be in [0, 1)");
    if (cfg.retry.max_delay_ms < cfg.retry.base_delay_ms)
        throw ConfigError("retry.max_delay_ms must not be below retry.base_delay_ms");

    return cfg;
}

Config Config::load_from(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("SOULWIRE_PROVIDER"))
        cfg.provider = v;
    if (const char* v = std::getenv("SOULWIRE_MODEL"))
        cfg.model = v;
    if (const char* v = std::getenv("SOULWIRE_YOLO")) {
        std::string s = v;
        cfg.yolo = (s == "1" || s == "true");
    }

    return cfg;
}

Config Config::load() {
    return load_from((std::filesystem::path(share_dir()) / "config.json").string());
}

SoulOptions Config::soul_options() const {
    SoulOptions opts;
    opts.loop.max_steps_per_run = loop_control.max_steps_per_run;
    opts.loop.max_retries_per_step = loop_control.max_retries_per_step;
    opts.retry.base_delay_ms = retry.base_delay_ms;
    opts.retry.max_delay_ms = retry.max_delay_ms;
    opts.retry.jitter = retry.jitter;
    opts.max_context_size = context.max_context_size;
    opts.compaction_ratio = context.compaction_ratio;
    opts.protected_tail = context.protected_tail;
    opts.model = model;
    opts.temperature = temperature;
    opts.max_depth = subagent_max_depth;
    return opts;
}

nlohmann::json Config::provider_config(const std::string& name) const {
    auto it = providers.find(name);
    if (it != providers.end()) return it->second;
    return nlohmann::json::object();
}

} // namespace soulwire
