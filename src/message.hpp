#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace soulwire {

enum class Role { System, User, Assistant, Tool };

inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "user";
}

Role role_from_string(const std::string& s);

struct ToolCall {
    std::string id;
    std::string name;
    std::string arguments; // raw JSON string

    bool operator==(const ToolCall& o) const {
        return id == o.id && name == o.name && arguments == o.arguments;
    }
};

enum class ToolCallStatus {
    Pending, AwaitingApproval, Approved, Denied, Executing, Completed, Failed, Interrupted
};

const char* tool_call_status_to_string(ToolCallStatus status);
ToolCallStatus tool_call_status_from_string(const std::string& s);

enum class PartType { Text, Think, ToolCall, ToolResult };

// One ordered content part of a Message.
// ToolCall parts use `call`; ToolResult parts use `call.id`/`call.name`
// for correlation and `text` for the output.
struct ContentPart {
    PartType type = PartType::Text;
    std::string text;
    ToolCall call;
    bool is_error = false;

    static ContentPart make_text(const std::string& text);
    static ContentPart make_think(const std::string& text);
    static ContentPart make_call(const ToolCall& call);
    static ContentPart make_result(const ToolCall& call, const std::string& output, bool is_error);

    bool operator==(const ContentPart& o) const {
        return type == o.type && text == o.text && call == o.call && is_error == o.is_error;
    }
};

struct Message {
    Role role = Role::User;
    std::vector<ContentPart> parts;
    uint64_t created_at = 0;   // epoch millis
    bool summary = false;      // synthetic compaction summary

    // Concatenated Text parts
    std::string text() const;
    std::vector<ToolCall> tool_calls() const;
    std::optional<std::string> tool_call_id() const;

    bool operator==(const Message& o) const {
        return role == o.role && parts == o.parts &&
               created_at == o.created_at && summary == o.summary;
    }
    bool operator!=(const Message& o) const { return !(*this == o); }
};

nlohmann::json message_to_json(const Message& msg);
Message message_from_json(const nlohmann::json& j);

} // namespace soulwire
