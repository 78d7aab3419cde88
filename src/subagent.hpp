#pragma once
#include "agentspec.hpp"
#include "soul.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace soulwire {

class WireBus;

// Live souls of one session, keyed by agent id. Parents are referenced by
// id only, so ownership stays a flat map.
class SoulArena {
public:
    Soul& add(std::unique_ptr<Soul> soul, std::optional<std::string> parent_id = std::nullopt);
    Soul* get(const std::string& id) const;
    // Returns the removed soul (null if unknown).
    std::unique_ptr<Soul> remove(const std::string& id);

    std::optional<std::string> parent_of(const std::string& id) const;
    std::vector<std::string> children_of(const std::string& id) const;
    size_t size() const;

private:
    struct Entry {
        std::unique_ptr<Soul> soul;
        std::optional<std::string> parent_id;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

// What a Task call asks the orchestrator to run.
struct SpawnRequest {
    std::string parent_id;
    uint32_t parent_depth = 0;
    std::shared_ptr<const AgentSpec> spec;
    std::vector<std::string> parent_tools;  // the child gets a subset of these
    std::string prompt;
    std::string tool_call_id;               // tags every child message
    const InterruptToken* interrupt = nullptr;
};

// Spawns and supervises subagent souls.
class Orchestrator {
public:
    // `log_dir` receives one log per subagent; empty keeps them in memory.
    Orchestrator(std::shared_ptr<Provider> provider,
                 std::shared_ptr<Approval> approval,
                 SoulOptions options,
                 std::string session_id,
                 std::string work_dir,
                 std::string log_dir,
                 WireBus* bus,
                 std::shared_ptr<SoulArena> arena);

    // Tools subagents may be given, by name.
    void add_tool(std::shared_ptr<Tool> tool);

    // Run a child soul for one turn and turn its outcome into the result
    // of the spawning Task call. Fails fast past the depth limit.
    ToolResult run(const SpawnRequest& request);

    uint32_t max_depth() const { return options_.max_depth; }
    SoulArena& arena() { return *arena_; }

private:
    std::unique_ptr<Soul> build_child(const SpawnRequest& request, uint32_t depth);

    std::shared_ptr<Provider> provider_;
    std::shared_ptr<Approval> approval_;
    SoulOptions options_;
    std::string session_id_;
    std::string work_dir_;
    std::string log_dir_;
    WireBus* bus_;
    std::shared_ptr<SoulArena> arena_;
    std::map<std::string, std::shared_ptr<Tool>> pool_;
};

} // namespace soulwire
