#pragma once
#include "../tool.hpp"
#include <cstddef>

namespace soulwire {

// Reads a window of numbered lines from a text file. The output ends with a
// bracketed footer naming the resolved path and the line range returned, and
// says where to continue when the window did not reach the end of the file.
class FileReadTool : public Tool {
public:
    static constexpr size_t kMaxLines = 1000;
    static constexpr size_t kMaxLineLength = 2000;
    static constexpr size_t kMaxOutput = 50000;

    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "file_read"; }
    std::string description() const override;
    std::string parameters_json() const override;
    ApprovalPolicy approval_policy() const override { return ApprovalPolicy::Never; }
    bool parallel_safe() const override { return true; }
};

} // namespace soulwire
