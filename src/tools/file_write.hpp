#pragma once
#include "../tool.hpp"

namespace soulwire {

class FileWriteTool : public Tool {
public:
    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "file_write"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace soulwire
