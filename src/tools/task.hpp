#pragma once
#include "../agentspec.hpp"
#include "../tool.hpp"
#include <memory>
#include <string>
#include <vector>

namespace soulwire {

class Orchestrator;

// Delegates a self-contained task to a named subagent. Calls are
// parallel-safe: several Task calls in one message run concurrently.
class TaskTool : public Tool {
public:
    static constexpr const char* kName = "task";

    TaskTool(Orchestrator& orchestrator, std::string owner_id, uint32_t owner_depth,
             std::shared_ptr<const AgentSpec> owner_spec,
             std::vector<std::string> owner_tools);

    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return kName; }
    std::string description() const override;
    std::string parameters_json() const override;
    ApprovalPolicy approval_policy() const override { return ApprovalPolicy::Never; }
    bool parallel_safe() const override { return true; }

private:
    std::string subagent_names() const;

    Orchestrator& orchestrator_;
    std::string owner_id_;
    uint32_t owner_depth_;
    std::shared_ptr<const AgentSpec> owner_spec_;
    std::vector<std::string> owner_tools_;
};

} // namespace soulwire
