#include "task.hpp"
#include "tool_util.hpp"
#include "../subagent.hpp"
#include <sstream>

namespace soulwire {

TaskTool::TaskTool(Orchestrator& orchestrator, std::string owner_id, uint32_t owner_depth,
                   std::shared_ptr<const AgentSpec> owner_spec,
                   std::vector<std::string> owner_tools)
    : orchestrator_(orchestrator)
    , owner_id_(std::move(owner_id))
    , owner_depth_(owner_depth)
    , owner_spec_(std::move(owner_spec))
    , owner_tools_(std::move(owner_tools))
{}

ToolResult TaskTool::execute(const std::string& args_json, const ToolContext& ctx) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "subagent_name")) return *err;
    if (auto err = require_string(args, "prompt")) return *err;

    std::string name = args["subagent_name"].get<std::string>();
    auto it = owner_spec_->subagents.find(name);
    if (it == owner_spec_->subagents.end()) {
        return ToolResult{false, "Unknown subagent: " + name +
                                 ". Available subagents: " + subagent_names()};
    }

    SpawnRequest request;
    request.parent_id = owner_id_;
    request.parent_depth = owner_depth_;
    request.spec = it->second.spec;
    request.parent_tools = owner_tools_;
    request.prompt = args["prompt"].get<std::string>();
    request.tool_call_id = ctx.tool_call_id;
    request.interrupt = &ctx.interrupt;
    return orchestrator_.run(request);
}

std::string TaskTool::subagent_names() const {
    if (owner_spec_->subagents.empty()) return "(none)";
    std::string names;
    for (const auto& [name, sub] : owner_spec_->subagents) {
        if (!names.empty()) names += ", ";
        names += name;
    }
    return names;
}

std::string TaskTool::description() const {
    std::ostringstream ss;
    ss << "Delegate a self-contained task to a subagent. The subagent starts with an "
          "empty context, so the prompt must carry everything it needs. Only its "
          "final report is returned.\n\nAvailable subagents:\n";
    for (const auto& [name, sub] : owner_spec_->subagents) {
        ss << "- " << name << ": " << sub.description << "\n";
    }
    return ss.str();
}

std::string TaskTool::parameters_json() const {
    return R"json({"type":"object","properties":{"description":{"type":"string","description":"Short (3-5 word) description of the task"},"subagent_name":{"type":"string","description":"Name of the subagent to run"},"prompt":{"type":"string","description":"Full task description for the subagent"}},"required":["subagent_name","prompt"]})json";
}

} // namespace soulwire
