#include "agentspec.hpp"
#include <algorithm>

namespace soulwire {

namespace {

const char* kMainPrompt =
    "You are Soulwire, an interactive coding agent running in a terminal.\n\n"
    "Current date: ${SOULWIRE_NOW}\n"
    "Working directory: ${SOULWIRE_WORK_DIR}\n\n"
    "Use the available tools to inspect and change the working directory. "
    "Explain what you are doing before calling a tool. "
    "Delegate self-contained subtasks with the task tool when that keeps "
    "the main conversation focused.\n"
    "${SOULWIRE_AGENTS_MD}";

const char* kCoderPrompt =
    "You are a subagent of Soulwire working on one delegated task.\n\n"
    "Current date: ${SOULWIRE_NOW}\n"
    "Working directory: ${SOULWIRE_WORK_DIR}\n\n"
    "Complete the task with the available tools, then reply with a concise "
    "report of what you found or changed. The report is the only thing the "
    "parent agent sees.\n"
    "${SOULWIRE_AGENTS_MD}";

} // namespace

AgentSpec default_agent_spec() {
    auto coder = std::make_shared<AgentSpec>();
    coder->name = "coder";
    coder->system_prompt = kCoderPrompt;
    coder->tools = {"shell", "file_read", "file_write"};

    AgentSpec spec;
    spec.name = "soulwire";
    spec.system_prompt = kMainPrompt;
    spec.tools = {"shell", "file_read", "file_write", "task"};
    spec.subagents["coder"] = SubagentSpec{
        "General software engineering subagent for focused, self-contained tasks",
        coder};
    return spec;
}

std::vector<std::string> select_tools(const AgentSpec& spec,
                                      const std::vector<std::string>& available) {
    auto listed = [](const std::vector<std::string>& names, const std::string& name) {
        return std::find(names.begin(), names.end(), name) != names.end();
    };
    std::vector<std::string> selected;
    for (const auto& name : available) {
        if (!spec.tools.empty() && !listed(spec.tools, name)) continue;
        if (listed(spec.exclude_tools, name)) continue;
        selected.push_back(name);
    }
    return selected;
}

} // namespace soulwire
