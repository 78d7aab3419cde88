#include "file_read.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>

static soulwire::ToolRegistrar reg_file_read("file_read",
    []() { return std::make_shared<soulwire::FileReadTool>(); });

namespace soulwire {

static std::string numbered(size_t line_no, const std::string& text) {
    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "%6zu\t", line_no);
    return prefix + text + "\n";
}

ToolResult FileReadTool::execute(const std::string& args_json, const ToolContext& ctx) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "path")) return *err;

    size_t offset = 1;
    size_t limit = kMaxLines;
    if (auto err = optional_count(args, "line_offset", offset)) return *err;
    if (auto err = optional_count(args, "n_lines", limit)) return *err;
    if (limit > kMaxLines) limit = kMaxLines;

    std::string path = args["path"].get<std::string>();
    if (auto err = validate_safe_path(path)) return *err;
    path = resolve_tool_path(ctx, path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return ToolResult{false, "File not found: " + path};
    }
    if (!std::filesystem::is_regular_file(path, ec)) {
        return ToolResult{false, "Not a regular file: " + path};
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        return ToolResult{false, "Failed to open file: " + path};
    }

    std::string out;
    std::string line;
    size_t line_no = 0;
    size_t count = 0;
    size_t first = 0;
    size_t last = 0;
    bool more = false;
    while (std::getline(file, line)) {
        if (ctx.interrupt.is_set()) {
            return ToolResult{false, "Interrupted while reading " + path};
        }
        line_no++;
        if (line_no < offset) continue;

        if (count == limit || out.size() >= kMaxOutput) {
            more = true;
            break;
        }
        if (line.size() > kMaxLineLength) {
            line = line.substr(0, kMaxLineLength) + " [line truncated]";
        }
        out += numbered(line_no, line);
        count++;
        if (first == 0) first = line_no;
        last = line_no;
    }

    if (first == 0) {
        if (line_no == 0) return ToolResult{true, "[" + path + " is empty]"};
        return ToolResult{true, "[" + path + " has " + std::to_string(line_no) +
                                " lines; nothing at line_offset=" + std::to_string(offset) + "]"};
    }

    out += "[Read lines " + std::to_string(first) + "-" + std::to_string(last) +
           " of " + path;
    if (more) {
        out += "; more lines follow, continue with line_offset=" + std::to_string(last + 1);
    }
    out += "]";
    return ToolResult{true, out};
}

std::string FileReadTool::description() const {
    return "Read a text file as numbered lines. Relative paths are resolved against the "
           "working directory. At most " + std::to_string(kMaxLines) +
           " lines are returned per call; use line_offset to page through longer files.";
}

std::string FileReadTool::parameters_json() const {
    return R"json({"type":"object","properties":{"path":{"type":"string","description":"The path of the file to read"},"line_offset":{"type":"integer","description":"First line to return, counting from 1 (default 1)"},"n_lines":{"type":"integer","description":"Number of lines to return (default and maximum 1000)"}},"required":["path"]})json";
}

} // namespace soulwire
