#include "echo.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>

static soulwire::ProviderRegistrar reg_echo("echo",
    [](const soulwire::Config&) { return std::make_shared<soulwire::EchoProvider>(); });

namespace soulwire {

ChatResponse EchoProvider::chat(const std::string& system_prompt,
                                const std::vector<Message>& messages,
                                const std::vector<ToolSpec>& tools,
                                const CompletionOptions& options,
                                const InterruptToken& interrupt) {
    (void)system_prompt;
    if (interrupt.is_set()) {
        throw TransientProviderError("request cancelled");
    }

    ChatResponse response;
    response.model = options.model;
    if (messages.empty()) {
        response.content = "(nothing to echo)";
        return response;
    }

    const Message& last = messages.back();
    if (last.role == Role::Tool) {
        std::string out;
        for (const auto& part : last.parts) {
            if (part.type != PartType::ToolResult) continue;
            out += (part.is_error ? "Tool " + part.call.name + " failed:\n"
                                  : "Tool " + part.call.name + " returned:\n");
            out += part.text;
        }
        response.content = out;
        return response;
    }

    std::string text = last.text();
    bool has_shell = std::any_of(tools.begin(), tools.end(),
        [](const ToolSpec& t) { return t.name == "shell"; });
    if (has_shell && text.size() > 2 && text.compare(0, 2, "$ ") == 0) {
        ToolCall call;
        call.id = "call_" + generate_id();
        call.name = "shell";
        call.arguments = nlohmann::json{{"command", text.substr(2)}}.dump();
        response.tool_calls.push_back(std::move(call));
        return response;
    }

    response.content = text;
    response.usage.prompt_tokens = estimate_tokens(text);
    response.usage.completion_tokens = response.usage.prompt_tokens;
    response.usage.total_tokens = response.usage.prompt_tokens * 2;
    return response;
}

std::string EchoProvider::chat_simple(const std::string& system_prompt,
                                      const std::string& message,
                                      const std::string& model) {
    (void)system_prompt;
    (void)model;
    return message;
}

} // namespace soulwire
