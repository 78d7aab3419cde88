#pragma once
#include "message.hpp"
#include "tool.hpp"
#include "interrupt.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace soulwire {

struct ModelCapabilities {
    bool thinking = false;  // can return reasoning content
    bool image_in = false;
};

struct TokenUsage {
    uint32_t prompt_tokens = 0;
    uint32_t completion_tokens = 0;
    uint32_t total_tokens = 0;
};

struct ChatResponse {
    std::optional<std::string> content;
    std::optional<std::string> thinking;
    std::vector<ToolCall> tool_calls;
    TokenUsage usage;
    std::string model;

    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool empty() const {
        return (!content || content->empty()) &&
               (!thinking || thinking->empty()) &&
               tool_calls.empty();
    }
};

struct CompletionOptions {
    std::string model;
    double temperature = 0.7;
    bool thinking = false;
};

// Model provider collaborator.
//
// chat() throws TransientProviderError for failures worth retrying
// (timeouts, connection resets, rate limits) and FatalProviderError for
// everything else (auth, malformed request, unsupported content).
// Implementations should return early with TransientProviderError when
// `interrupt` is set mid-call.
class Provider {
public:
    virtual ~Provider() = default;

    virtual ChatResponse chat(const std::string& system_prompt,
                              const std::vector<Message>& messages,
                              const std::vector<ToolSpec>& tools,
                              const CompletionOptions& options,
                              const InterruptToken& interrupt) = 0;

    // One-shot completion without tools, used for summaries.
    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model) = 0;

    virtual ModelCapabilities capabilities(const std::string& model) const {
        (void)model;
        return {};
    }
    virtual std::string provider_name() const = 0;
};

} // namespace soulwire
