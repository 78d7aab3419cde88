#pragma once
#include "../provider.hpp"
#include <string>

namespace soulwire {

// Offline provider for smoke tests: repeats the latest user message.
// A message of the form "$ <command>" becomes a shell tool call, and the
// tool output is reported back in the following step.
class EchoProvider : public Provider {
public:
    ChatResponse chat(const std::string& system_prompt,
                      const std::vector<Message>& messages,
                      const std::vector<ToolSpec>& tools,
                      const CompletionOptions& options,
                      const InterruptToken& interrupt) override;

    std::string chat_simple(const std::string& system_prompt,
                            const std::string& message,
                            const std::string& model) override;

    std::string provider_name() const override { return "echo"; }
};

} // namespace soulwire
