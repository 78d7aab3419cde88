#pragma once
#include "interrupt.hpp"
#include <string>
#include <memory>
#include <vector>

namespace soulwire {

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

// Whether a call must be confirmed before execute() runs.
enum class ApprovalPolicy {
    Never,   // runs without asking
    Always,  // asks on every call; only YOLO mode skips the question
    Session  // asks unless YOLO mode is on or the tool was always-allowed
};

// Per-dispatch information handed to a tool.
struct ToolContext {
    std::string tool_call_id;
    std::string turn_id;
    std::string work_dir;
    const InterruptToken& interrupt;
};

// A tool capability registered into the Hub. execute() reports logic
// failures through ToolResult{false, ...}; long-running tools should poll
// ctx.interrupt and return early when it is set.
class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json, const ToolContext& ctx) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;
    virtual ApprovalPolicy approval_policy() const { return ApprovalPolicy::Session; }
    // Independent calls to this tool may run concurrently.
    virtual bool parallel_safe() const { return false; }

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

} // namespace soulwire
