#pragma once
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace soulwire {

struct AgentSpec;

// A named subagent an agent may delegate to through the Task tool.
struct SubagentSpec {
    std::string description;
    std::shared_ptr<const AgentSpec> spec;
};

// Static description of an agent: its prompt template, the tools it may use
// and the subagents it may delegate to.
struct AgentSpec {
    std::string name;
    std::string system_prompt;               // template, see build_system_prompt()
    std::vector<std::string> tools;          // empty = every tool the parent has
    std::vector<std::string> exclude_tools;
    std::map<std::string, SubagentSpec> subagents;
};

// Agent used by the CLI: shell + file tools, Task delegation to a "coder"
// subagent that has the same tools but cannot delegate further.
AgentSpec default_agent_spec();

// Names from `available` this spec may use, in `available` order.
std::vector<std::string> select_tools(const AgentSpec& spec,
                                      const std::vector<std::string>& available);

} // namespace soulwire
