#include "compaction.hpp"
#include "provider.hpp"
#include "util.hpp"
#include <iostream>
#include <sstream>

namespace soulwire {

uint32_t CharRatioEstimator::estimate(const std::vector<Message>& messages) const {
    uint32_t total = 0;
    for (const auto& msg : messages) {
        for (const auto& part : msg.parts) {
            total += estimate_tokens(part.text);
            if (part.type == PartType::ToolCall) {
                total += estimate_tokens(part.call.name) + estimate_tokens(part.call.arguments);
            }
        }
    }
    return total;
}

static constexpr size_t kMaxTopics = 8;
static constexpr size_t kMaxTopicLength = 80;

std::string CountingSummarizer::summarize(const std::vector<Message>& prefix) {
    std::ostringstream summary;
    summary << "[Conversation history compacted. Previous discussion covered: ";

    int user_count = 0;
    int assistant_count = 0;
    int tool_count = 0;
    std::string earlier;
    std::vector<std::string> topics;

    for (const auto& msg : prefix) {
        if (msg.summary) {
            earlier = msg.text();
            continue;
        }
        switch (msg.role) {
            case Role::User:
                user_count++;
                if (topics.size() < kMaxTopics) {
                    std::string topic = first_line(msg.text());
                    if (topic.size() > kMaxTopicLength) {
                        topic = topic.substr(0, kMaxTopicLength) + "...";
                    }
                    if (!topic.empty()) topics.push_back(topic);
                }
                break;
            case Role::Assistant: assistant_count++; break;
            case Role::Tool: tool_count++; break;
            default: break;
        }
    }

    summary << user_count << " user messages, "
            << assistant_count << " assistant responses";
    if (tool_count > 0) {
        summary << ", " << tool_count << " tool results";
    }
    summary << "]";

    if (!topics.empty()) {
        summary << "\nUser requests:";
        for (const auto& t : topics) {
            summary << "\n- " << t;
        }
    }
    if (!earlier.empty()) {
        summary << "\nEarlier:\n" << earlier;
    }
    return summary.str();
}

ProviderSummarizer::ProviderSummarizer(std::shared_ptr<Provider> provider, std::string model)
    : provider_(std::move(provider)), model_(std::move(model))
{}

std::string ProviderSummarizer::summarize(const std::vector<Message>& prefix) {
    std::ostringstream transcript;
    for (const auto& msg : prefix) {
        transcript << role_to_string(msg.role) << ": ";
        for (const auto& part : msg.parts) {
            switch (part.type) {
                case PartType::Text: transcript << part.text; break;
                case PartType::Think: break;
                case PartType::ToolCall:
                    transcript << "[call " << part.call.name << " " << part.call.arguments << "]";
                    break;
                case PartType::ToolResult:
                    transcript << "[" << (part.is_error ? "error" : "result") << " "
                               << part.text << "]";
                    break;
            }
        }
        transcript << "\n";
    }

    try {
        std::string result = provider_->chat_simple(
            "You compress conversations. Summarize the conversation below so the "
            "assistant can continue the work: goals, decisions, files touched, "
            "open tasks. Reply with the summary only.",
            transcript.str(), model_);
        if (!trim(result).empty()) {
            return "[Conversation history compacted]\n" + trim(result);
        }
    } catch (const std::exception& e) {
        std::cerr << "[compact] Provider summary failed, using counts: " << e.what() << '\n';
    }
    return fallback_.summarize(prefix);
}

} // namespace soulwire
