#include "wire.hpp"
#include "errors.hpp"

namespace soulwire {

const char* wire_kind_to_string(WireKind kind) {
    switch (kind) {
        case WireKind::Event: return "event";
        case WireKind::Request: return "request";
        case WireKind::Response: return "response";
    }
    return "event";
}

static std::optional<WireKind> wire_kind_from_string(const std::string& s) {
    if (s == "event") return WireKind::Event;
    if (s == "request") return WireKind::Request;
    if (s == "response") return WireKind::Response;
    return std::nullopt;
}

bool WireMessage::is_status(const char* status) const {
    return type == wire_types::StatusUpdate && payload.is_object() &&
           payload.value("status", "") == status;
}

bool is_known_wire_type(WireKind kind, const std::string& type) {
    using namespace wire_types;
    switch (kind) {
        case WireKind::Event:
            return type == TurnBegin || type == AssistantDelta ||
                   type == ToolCallStarted || type == ToolCallResult ||
                   type == StatusUpdate || type == TurnEnd || type == Error;
        case WireKind::Request:
            return type == ApprovalRequest || type == Prompt || type == Cancel;
        case WireKind::Response:
            return type == ApprovalResponse;
    }
    return false;
}

std::string encode_wire_message(const WireMessage& msg) {
    nlohmann::json j = {
        {"kind", wire_kind_to_string(msg.kind)},
        {"type", msg.type},
        {"seq", msg.seq},
        {"session_id", msg.session_id},
        {"timestamp", msg.timestamp},
        {"payload", msg.payload}
    };
    if (msg.turn_id) j["turn_id"] = *msg.turn_id;
    if (msg.tool_call_id) j["tool_call_id"] = *msg.tool_call_id;
    if (msg.parent_tool_call_id) j["parent_tool_call_id"] = *msg.parent_tool_call_id;
    return j.dump();
}

static std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

std::optional<WireMessage> decode_wire_message(const std::string& line) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        throw ProtocolError(std::string("malformed wire line: ") + e.what());
    }
    if (!j.is_object()) {
        throw ProtocolError("wire line is not a JSON object");
    }
    if (!j.contains("kind") || !j["kind"].is_string() ||
        !j.contains("type") || !j["type"].is_string()) {
        throw ProtocolError("wire message missing kind or type");
    }

    auto kind = wire_kind_from_string(j["kind"].get<std::string>());
    if (!kind) return std::nullopt;
    std::string type = j["type"].get<std::string>();
    if (!is_known_wire_type(*kind, type)) return std::nullopt;

    WireMessage msg;
    msg.kind = *kind;
    msg.type = std::move(type);
    if (j.contains("seq") && j["seq"].is_number_unsigned())
        msg.seq = j["seq"].get<uint64_t>();
    msg.session_id = optional_string(j, "session_id").value_or("");
    msg.turn_id = optional_string(j, "turn_id");
    msg.tool_call_id = optional_string(j, "tool_call_id");
    msg.parent_tool_call_id = optional_string(j, "parent_tool_call_id");
    if (j.contains("timestamp") && j["timestamp"].is_number_unsigned())
        msg.timestamp = j["timestamp"].get<uint64_t>();
    if (j.contains("payload") && j["payload"].is_object())
        msg.payload = j["payload"];
    return msg;
}

const char* approval_decision_to_string(ApprovalDecision d) {
    switch (d) {
        case ApprovalDecision::Approve: return "approve";
        case ApprovalDecision::Deny: return "deny";
        case ApprovalDecision::AlwaysAllow: return "always_allow";
    }
    return "deny";
}

ApprovalDecision approval_decision_from_string(const std::string& s) {
    if (s == "approve") return ApprovalDecision::Approve;
    if (s == "deny") return ApprovalDecision::Deny;
    if (s == "always_allow" || s == "always-allow") return ApprovalDecision::AlwaysAllow;
    throw ProtocolError("unknown approval decision: " + s);
}

} // namespace soulwire
