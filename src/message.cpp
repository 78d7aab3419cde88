#include "message.hpp"

namespace soulwire {

Role role_from_string(const std::string& s) {
    if (s == "system") return Role::System;
    if (s == "assistant") return Role::Assistant;
    if (s == "tool") return Role::Tool;
    return Role::User;
}

const char* tool_call_status_to_string(ToolCallStatus status) {
    switch (status) {
        case ToolCallStatus::Pending: return "pending";
        case ToolCallStatus::AwaitingApproval: return "awaiting_approval";
        case ToolCallStatus::Approved: return "approved";
        case ToolCallStatus::Denied: return "denied";
        case ToolCallStatus::Executing: return "executing";
        case ToolCallStatus::Completed: return "completed";
        case ToolCallStatus::Failed: return "failed";
        case ToolCallStatus::Interrupted: return "interrupted";
    }
    return "pending";
}

ToolCallStatus tool_call_status_from_string(const std::string& s) {
    if (s == "awaiting_approval") return ToolCallStatus::AwaitingApproval;
    if (s == "approved") return ToolCallStatus::Approved;
    if (s == "denied") return ToolCallStatus::Denied;
    if (s == "executing") return ToolCallStatus::Executing;
    if (s == "completed") return ToolCallStatus::Completed;
    if (s == "failed") return ToolCallStatus::Failed;
    if (s == "interrupted") return ToolCallStatus::Interrupted;
    return ToolCallStatus::Pending;
}

ContentPart ContentPart::make_text(const std::string& text) {
    ContentPart p;
    p.type = PartType::Text;
    p.text = text;
    return p;
}

ContentPart ContentPart::make_think(const std::string& text) {
    ContentPart p;
    p.type = PartType::Think;
    p.text = text;
    return p;
}

ContentPart ContentPart::make_call(const ToolCall& call) {
    ContentPart p;
    p.type = PartType::ToolCall;
    p.call = call;
    return p;
}

ContentPart ContentPart::make_result(const ToolCall& call, const std::string& output,
                                     bool is_error) {
    ContentPart p;
    p.type = PartType::ToolResult;
    p.call.id = call.id;
    p.call.name = call.name;
    p.text = output;
    p.is_error = is_error;
    return p;
}

std::string Message::text() const {
    std::string out;
    for (const auto& part : parts) {
        if (part.type == PartType::Text) out += part.text;
    }
    return out;
}

std::vector<ToolCall> Message::tool_calls() const {
    std::vector<ToolCall> calls;
    for (const auto& part : parts) {
        if (part.type == PartType::ToolCall) calls.push_back(part.call);
    }
    return calls;
}

std::optional<std::string> Message::tool_call_id() const {
    for (const auto& part : parts) {
        if (part.type == PartType::ToolResult) return part.call.id;
    }
    return std::nullopt;
}

static const char* part_type_name(PartType t) {
    switch (t) {
        case PartType::Text: return "text";
        case PartType::Think: return "think";
        case PartType::ToolCall: return "tool_call";
        case PartType::ToolResult: return "tool_result";
    }
    return "text";
}

static PartType part_type_from(const std::string& s) {
    if (s == "think") return PartType::Think;
    if (s == "tool_call") return PartType::ToolCall;
    if (s == "tool_result") return PartType::ToolResult;
    return PartType::Text;
}

nlohmann::json message_to_json(const Message& msg) {
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& p : msg.parts) {
        nlohmann::json jp = {{"type", part_type_name(p.type)}};
        switch (p.type) {
            case PartType::Text:
            case PartType::Think:
                jp["text"] = p.text;
                break;
            case PartType::ToolCall:
                jp["id"] = p.call.id;
                jp["name"] = p.call.name;
                jp["arguments"] = p.call.arguments;
                break;
            case PartType::ToolResult:
                jp["id"] = p.call.id;
                jp["name"] = p.call.name;
                jp["output"] = p.text;
                jp["is_error"] = p.is_error;
                break;
        }
        parts.push_back(std::move(jp));
    }
    nlohmann::json j = {
        {"role", role_to_string(msg.role)},
        {"parts", parts},
        {"created_at", msg.created_at}
    };
    if (msg.summary) j["summary"] = true;
    return j;
}

Message message_from_json(const nlohmann::json& j) {
    Message msg;
    msg.role = role_from_string(j.value("role", "user"));
    msg.created_at = j.value("created_at", uint64_t{0});
    msg.summary = j.value("summary", false);
    if (j.contains("parts") && j["parts"].is_array()) {
        for (const auto& jp : j["parts"]) {
            ContentPart p;
            p.type = part_type_from(jp.value("type", "text"));
            switch (p.type) {
                case PartType::Text:
                case PartType::Think:
                    p.text = jp.value("text", "");
                    break;
                case PartType::ToolCall:
                    p.call.id = jp.value("id", "");
                    p.call.name = jp.value("name", "");
                    p.call.arguments = jp.value("arguments", "{}");
                    break;
                case PartType::ToolResult:
                    p.call.id = jp.value("id", "");
                    p.call.name = jp.value("name", "");
                    p.text = jp.value("output", "");
                    p.is_error = jp.value("is_error", false);
                    break;
            }
            msg.parts.push_back(std::move(p));
        }
    }
    return msg;
}

} // namespace soulwire
