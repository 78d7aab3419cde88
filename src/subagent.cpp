#include "subagent.hpp"
#include "prompt.hpp"
#include "tools/task.hpp"
#include "util.hpp"
#include <filesystem>
#include <iostream>

namespace soulwire {

// ── SoulArena ───────────────────────────────────────────────────

Soul& SoulArena::add(std::unique_ptr<Soul> soul, std::optional<std::string> parent_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = soul->id();
    auto& entry = entries_[id];
    entry.soul = std::move(soul);
    entry.parent_id = std::move(parent_id);
    return *entry.soul;
}

Soul* SoulArena::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? nullptr : it->second.soul.get();
}

std::unique_ptr<Soul> SoulArena::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return nullptr;
    auto soul = std::move(it->second.soul);
    entries_.erase(it);
    return soul;
}

std::optional<std::string> SoulArena::parent_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second.parent_id;
}

std::vector<std::string> SoulArena::children_of(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> children;
    for (const auto& [child_id, entry] : entries_) {
        if (entry.parent_id && *entry.parent_id == id) children.push_back(child_id);
    }
    return children;
}

size_t SoulArena::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

// ── Orchestrator ────────────────────────────────────────────────

Orchestrator::Orchestrator(std::shared_ptr<Provider> provider,
                           std::shared_ptr<Approval> approval,
                           SoulOptions options,
                           std::string session_id,
                           std::string work_dir,
                           std::string log_dir,
                           WireBus* bus,
                           std::shared_ptr<SoulArena> arena)
    : provider_(std::move(provider))
    , approval_(std::move(approval))
    , options_(std::move(options))
    , session_id_(std::move(session_id))
    , work_dir_(std::move(work_dir))
    , log_dir_(std::move(log_dir))
    , bus_(bus)
    , arena_(arena ? std::move(arena) : std::make_shared<SoulArena>())
{}

void Orchestrator::add_tool(std::shared_ptr<Tool> tool) {
    std::string name = tool->tool_name();
    pool_[name] = std::move(tool);
}

std::unique_ptr<Soul> Orchestrator::build_child(const SpawnRequest& request, uint32_t depth) {
    std::string child_id = "sub_" + generate_id();

    std::unique_ptr<WireLog> log;
    if (!log_dir_.empty()) {
        log = std::make_unique<WireLog>(
            (std::filesystem::path(log_dir_) / (child_id + ".jsonl")).string());
    }

    SoulOptions opts = options_;
    opts.depth = depth;
    auto child = std::make_unique<Soul>(child_id, session_id_, provider_, approval_,
                                        opts, std::move(log), bus_);
    child->emitter().set_parent_tool_call_id(request.tool_call_id);
    if (request.interrupt) {
        child->set_interrupt_token(InterruptToken::child_of(*request.interrupt));
    }
    child->hub().set_work_dir(work_dir_);
    child->set_system_prompt(build_system_prompt(request.spec->system_prompt,
                                                 make_prompt_args(work_dir_)));

    std::vector<std::string> names;
    for (const auto& name : select_tools(*request.spec, request.parent_tools)) {
        if (name == TaskTool::kName) continue;
        auto it = pool_.find(name);
        if (it == pool_.end()) continue;
        child->hub().register_tool(it->second);
        names.push_back(name);
    }
    if (!request.spec->subagents.empty()) {
        child->hub().register_tool(std::make_shared<TaskTool>(
            *this, child_id, depth, request.spec, names));
    }
    return child;
}

ToolResult Orchestrator::run(const SpawnRequest& request) {
    uint32_t depth = request.parent_depth + 1;
    if (depth > options_.max_depth) {
        std::cerr << "[subagent] Refusing spawn at depth " << depth
                  << " (max " << options_.max_depth << ")\n";
        return ToolResult{false, "Subagent depth limit exceeded: depth " +
                                 std::to_string(depth) + " > max " +
                                 std::to_string(options_.max_depth)};
    }
    if (!request.spec) {
        return ToolResult{false, "Subagent spec is missing"};
    }

    auto child = build_child(request, depth);
    std::string child_id = child->id();
    Soul& soul = arena_->add(std::move(child), request.parent_id);
    std::cerr << "[subagent] Spawned " << request.spec->name << " (" << child_id
              << ") at depth " << depth << '\n';

    // Removed when the parent consumes the result, on every path.
    struct ArenaRelease {
        SoulArena& arena;
        std::string id;
        ~ArenaRelease() { arena.remove(id); }
    } release{*arena_, child_id};

    TurnResult turn = soul.run_turn(request.prompt);
    switch (turn.outcome) {
        case TurnOutcome::Completed:
            if (turn.final_text.empty()) {
                return ToolResult{true, "(subagent finished without a report)"};
            }
            return ToolResult{true, turn.final_text};
        case TurnOutcome::Interrupted:
            return ToolResult{false, "Subagent interrupted: " + turn.cause};
        case TurnOutcome::Failed:
            break;
    }
    return ToolResult{false, "Subagent failed: " + turn.cause};
}

} // namespace soulwire
