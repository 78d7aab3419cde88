#include "runtime.hpp"
#include "plugin.hpp"
#include "prompt.hpp"
#include "tools/task.hpp"
#include "wire_log.hpp"
#include <algorithm>
#include <iostream>

namespace soulwire {

static constexpr const char* kRootId = "root";

Runtime::Runtime(const Config& config,
                 std::shared_ptr<Provider> provider,
                 const RuntimeOptions& options,
                 AgentSpec spec,
                 std::vector<std::shared_ptr<Tool>> tools)
    : config_(config)
    , store_(options.share_dir.empty() ? share_dir() : options.share_dir)
    , approval_(std::make_shared<Approval>(config.yolo || options.yolo))
    , spec_(std::make_shared<const AgentSpec>(std::move(spec)))
    , arena_(std::make_shared<SoulArena>())
{
    std::optional<Session> existing;
    if (options.continue_last) {
        existing = store_.continue_last(options.work_dir);
        if (!existing) {
            std::cerr << "[session] No previous session for " << options.work_dir
                      << ", starting a new one\n";
        }
    }
    session_ = existing ? *existing : store_.create(options.work_dir);

    lock_ = std::make_unique<SessionLock>(
        session_.dir, std::chrono::milliseconds(config_.lock_timeout_ms));

    // Read before the log is reopened for appending.
    auto history = WireLog::read(session_.log_path);

    SoulOptions soul_opts = config_.soul_options();
    orchestrator_ = std::make_unique<Orchestrator>(
        provider, approval_, soul_opts, session_.id, session_.work_dir,
        session_.subagent_dir(), &bus_, arena_);

    auto root = std::make_unique<Soul>(kRootId, session_.id, provider, approval_, soul_opts,
                                       std::make_unique<WireLog>(session_.log_path), &bus_);
    root->hub().set_work_dir(session_.work_dir);
    root->set_system_prompt(build_system_prompt(spec_->system_prompt,
                                                make_prompt_args(session_.work_dir)));
    if (config_.context.summarizer == "provider") {
        root->set_summarizer(std::make_shared<ProviderSummarizer>(provider, soul_opts.model));
    }

    if (tools.empty()) {
        tools = PluginRegistry::instance().builtin_tools();
    }
    std::vector<std::string> available;
    for (const auto& tool : tools) {
        orchestrator_->add_tool(tool);
        available.push_back(tool->tool_name());
    }
    if (!spec_->subagents.empty()) available.push_back(TaskTool::kName);

    auto selected = select_tools(*spec_, available);
    std::vector<std::string> root_tools;
    for (const auto& name : selected) {
        if (name == TaskTool::kName) continue;
        for (const auto& tool : tools) {
            if (tool->tool_name() == name) root->hub().register_tool(tool);
        }
        root_tools.push_back(name);
    }
    if (std::find(selected.begin(), selected.end(), TaskTool::kName) != selected.end()) {
        root->hub().register_tool(std::make_shared<TaskTool>(
            *orchestrator_, kRootId, 0, spec_, root_tools));
    }

    if (!history.empty()) {
        root->restore(history);
        resumed_ = true;
        std::cerr << "[session] Restored " << root->context().size() << " messages from "
                  << session_.log_path << '\n';
    }

    soul_ = &arena_->add(std::move(root));
}

} // namespace soulwire
