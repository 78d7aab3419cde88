#pragma once
#include <string>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace soulwire {

// Tagged union carried on the duplex channel and in the durable log.
// One JSON object per line; unknown kinds, types and fields are ignored
// by receivers.

enum class WireKind { Event, Request, Response };

const char* wire_kind_to_string(WireKind kind);

// ── Message type tags ───────────────────────────────────────────

namespace wire_types {
    // Events
    constexpr const char* TurnBegin        = "TurnBegin";
    constexpr const char* AssistantDelta   = "AssistantDelta";
    constexpr const char* ToolCallStarted  = "ToolCallStarted";
    constexpr const char* ToolCallResult   = "ToolCallResult";
    constexpr const char* StatusUpdate     = "StatusUpdate";
    constexpr const char* TurnEnd          = "TurnEnd";
    constexpr const char* Error            = "Error";
    // Requests
    constexpr const char* ApprovalRequest  = "ApprovalRequest";
    constexpr const char* Prompt           = "Prompt";
    constexpr const char* Cancel           = "Cancel";
    // Responses
    constexpr const char* ApprovalResponse = "ApprovalResponse";
} // namespace wire_types

// StatusUpdate payload "status" values
namespace wire_status {
    constexpr const char* Compacted = "compacted";
    constexpr const char* Cleared   = "cleared";
    constexpr const char* Appended  = "appended";
    constexpr const char* Retrying  = "retrying";
} // namespace wire_status

struct WireMessage {
    WireKind kind = WireKind::Event;
    std::string type;
    uint64_t seq = 0;
    std::string session_id;
    std::optional<std::string> turn_id;
    std::optional<std::string> tool_call_id;
    std::optional<std::string> parent_tool_call_id; // set on subagent messages
    uint64_t timestamp = 0;                          // epoch millis
    nlohmann::json payload = nlohmann::json::object();

    bool is(const char* t) const { return type == t; }
    bool is_status(const char* status) const;
};

// True when this build understands (kind, type).
bool is_known_wire_type(WireKind kind, const std::string& type);

// Encode one message as a single line (no trailing newline).
std::string encode_wire_message(const WireMessage& msg);

// Decode one line. Returns nullopt for unknown kinds or types.
// Throws ProtocolError if the line is not a well-formed message.
std::optional<WireMessage> decode_wire_message(const std::string& line);

// ── Approval decisions ──────────────────────────────────────────

enum class ApprovalDecision { Approve, Deny, AlwaysAllow };

const char* approval_decision_to_string(ApprovalDecision d);

// Throws ProtocolError on an unrecognized value.
ApprovalDecision approval_decision_from_string(const std::string& s);

} // namespace soulwire
