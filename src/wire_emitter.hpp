#pragma once
#include "wire.hpp"
#include <string>
#include <optional>
#include <mutex>
#include <cstdint>

namespace soulwire {

class WireLog;
class WireBus;

// Stamps and emits the wire messages of one Soul: assigns the next
// sequence number, appends to the durable log, then publishes to the bus.
// A message is committed only once its log append succeeded.
class WireEmitter {
public:
    // log and bus are non-owning and may be null.
    WireEmitter(std::string session_id, WireLog* log, WireBus* bus);

    // Subagent souls tag every message with the spawning Task call id.
    void set_parent_tool_call_id(const std::string& id) { parent_tool_call_id_ = id; }
    const std::optional<std::string>& parent_tool_call_id() const { return parent_tool_call_id_; }

    WireMessage emit(WireKind kind, const std::string& type,
                     nlohmann::json payload = nlohmann::json::object(),
                     const std::optional<std::string>& turn_id = std::nullopt,
                     const std::optional<std::string>& tool_call_id = std::nullopt);

    WireMessage event(const std::string& type,
                      nlohmann::json payload = nlohmann::json::object(),
                      const std::optional<std::string>& turn_id = std::nullopt,
                      const std::optional<std::string>& tool_call_id = std::nullopt) {
        return emit(WireKind::Event, type, std::move(payload), turn_id, tool_call_id);
    }

    // Continue numbering after a replayed log whose last seq is `seq`.
    void resume_after(uint64_t seq);

    uint64_t last_seq() const;
    const std::string& session_id() const { return session_id_; }

private:
    std::string session_id_;
    WireLog* log_;
    WireBus* bus_;
    std::optional<std::string> parent_tool_call_id_;
    mutable std::mutex mutex_;
    uint64_t next_seq_ = 1;
};

} // namespace soulwire
