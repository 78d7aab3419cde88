#pragma once
#include "agentspec.hpp"
#include "approval.hpp"
#include "config.hpp"
#include "session.hpp"
#include "soul.hpp"
#include "subagent.hpp"
#include "wire_bus.hpp"
#include <memory>
#include <string>
#include <vector>

namespace soulwire {

struct RuntimeOptions {
    std::string work_dir = ".";
    std::string share_dir;        // empty = share_dir()
    bool continue_last = false;   // resume the directory's last session
    bool yolo = false;            // OR-ed with config.yolo
};

// One running session: owns the session lock, the wire bus, the shared
// approval state, the subagent orchestrator and the root soul.
class Runtime {
public:
    // Tools default to every tool in the plugin registry; the agent spec
    // selects which of them the root soul gets. Throws SessionBusyError
    // if another process holds the session.
    Runtime(const Config& config,
            std::shared_ptr<Provider> provider,
            const RuntimeOptions& options,
            AgentSpec spec = default_agent_spec(),
            std::vector<std::shared_ptr<Tool>> tools = {});

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    Soul& soul() { return *soul_; }
    WireBus& bus() { return bus_; }
    Approval& approval() { return *approval_; }
    SoulArena& arena() { return *arena_; }
    Orchestrator& orchestrator() { return *orchestrator_; }
    const Session& session() const { return session_; }
    const Config& config() const { return config_; }
    const AgentSpec& spec() const { return *spec_; }

    // True when the session was reopened from an existing log.
    bool resumed() const { return resumed_; }

private:
    Config config_;
    SessionStore store_;
    Session session_;
    std::unique_ptr<SessionLock> lock_;
    WireBus bus_;
    std::shared_ptr<Approval> approval_;
    std::shared_ptr<const AgentSpec> spec_;
    std::shared_ptr<SoulArena> arena_;
    std::unique_ptr<Orchestrator> orchestrator_;
    Soul* soul_ = nullptr;
    bool resumed_ = false;
};

} // namespace soulwire
