#include "file_write.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <fstream>
#include <filesystem>

static soulwire::ToolRegistrar reg_file_write("file_write",
    []() { return std::make_shared<soulwire::FileWriteTool>(); });

namespace soulwire {

ToolResult FileWriteTool::execute(const std::string& args_json, const ToolContext& ctx) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;
    if (auto err = require_string(args, "content")) return *err;

    std::string mode = "overwrite";
    if (args.contains("mode")) {
        mode = args["mode"].is_string() ? args["mode"].get<std::string>() : "";
    }
    if (mode != "overwrite" && mode != "append") {
        return ToolResult{false, "Parameter mode must be \"overwrite\" or \"append\""};
    }

    std::string path = args["path"].get<std::string>();
    if (auto err = validate_safe_path(path)) return *err;
    path = resolve_tool_path(ctx, path);
    const std::string content = args["content"].get<std::string>();

    // Approval may have taken a while; do not touch the disk for a cancelled turn.
    if (ctx.interrupt.is_set()) {
        return ToolResult{false, "Interrupted before writing " + path};
    }

    std::filesystem::path fs_path(path);
    std::error_code ec;
    if (std::filesystem::is_directory(fs_path, ec)) {
        return ToolResult{false, "Not a regular file: " + path};
    }
    bool existed = std::filesystem::exists(fs_path, ec);
    if (fs_path.has_parent_path()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            return ToolResult{false, "Failed to create directories: " + ec.message()};
        }
    }

    if (mode == "append") {
        std::ofstream file(path, std::ios::app | std::ios::binary);
        if (!file.is_open()) {
            return ToolResult{false, "Failed to open file for appending: " + path};
        }
        file << content;
        file.close();
        if (file.fail()) {
            return ToolResult{false, "Failed to append to file: " + path};
        }
        return ToolResult{true, "Appended " + std::to_string(content.size()) +
                                " bytes to " + path};
    }

    // Readers of the file never see it half written.
    if (!atomic_write_file(path, content)) {
        return ToolResult{false, "Failed to write to file: " + path};
    }
    return ToolResult{true, std::string(existed ? "Overwrote " : "Wrote ") +
                            std::to_string(content.size()) + " bytes to " + path};
}

std::string FileWriteTool::description() const {
    return "Write content to a file, creating it and its parent directories if needed. "
           "Mode \"overwrite\" (default) replaces the file; \"append\" adds to its end.";
}

std::string FileWriteTool::parameters_json() const {
    return R"({"type":"object","properties":{"path":{"type":"string","description":"The path of the file to write"},"content":{"type":"string","description":"The content to write"},"mode":{"type":"string","enum":["overwrite","append"],"description":"overwrite (default) or append"}},"required":["path","content"]})";
}

} // namespace soulwire
