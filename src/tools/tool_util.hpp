#pragma once
#include "../tool.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <optional>

namespace soulwire {

// Parse JSON tool arguments. Returns error ToolResult on failure.
inline std::optional<ToolResult> parse_tool_json(
    const std::string& args_json, nlohmann::json& out) {
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) {
        return ToolResult{false, "Arguments must be a JSON object"};
    }
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

// Read an optional positive integer field into `out`, leaving it untouched
// when the field is absent.
inline std::optional<ToolResult> optional_count(const nlohmann::json& args, const char* field,
                                                size_t& out) {
    if (!args.contains(field)) return std::nullopt;
    const auto& v = args[field];
    if (!v.is_number_integer() || v.get<int64_t>() < 1) {
        return ToolResult{false, std::string("Parameter ") + field +
                                 " must be a positive integer"};
    }
    out = static_cast<size_t>(v.get<int64_t>());
    return std::nullopt;
}

// Reject paths containing ".." to prevent directory traversal.
inline std::optional<ToolResult> validate_safe_path(const std::string& path) {
    if (path.find("..") != std::string::npos) {
        return ToolResult{false, "Path must not contain '..'"};
    }
    return std::nullopt;
}

// Relative paths are taken from the session's working directory.
inline std::string resolve_tool_path(const ToolContext& ctx, const std::string& path) {
    std::filesystem::path p(path);
    if (p.is_absolute() || ctx.work_dir.empty()) return p.string();
    return (std::filesystem::path(ctx.work_dir) / p).string();
}

} // namespace soulwire
