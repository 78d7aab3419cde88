#pragma once
#include "message.hpp"
#include "wire.hpp"
#include "compaction.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>

namespace soulwire {

class WireEmitter;

// A tool call recorded in the context that has no result yet.
struct OpenToolCall {
    ToolCall call;
    std::string turn_id;
    ToolCallStatus status = ToolCallStatus::Pending;
};

// Ordered message history of one Soul.
//
// Every mutation goes through commit(): the wire message is emitted (and
// durably logged) first, then apply() folds it into memory. Replay runs the
// same apply() over the logged messages, so an identical log always yields
// an identical context.
class Context {
public:
    explicit Context(WireEmitter* wire = nullptr,
                     std::shared_ptr<const TokenEstimator> estimator = nullptr);

    // Emit one wire message and apply it. Returns the committed message.
    WireMessage commit(WireKind kind, const std::string& type,
                       nlohmann::json payload = nlohmann::json::object(),
                       const std::optional<std::string>& turn_id = std::nullopt,
                       const std::optional<std::string>& tool_call_id = std::nullopt);

    // ── Context mutations ───────────────────────────────────────
    void begin_turn(const std::string& turn_id, const std::string& user_input);
    void append_text(const std::string& turn_id, uint32_t step, const std::string& text);
    void append_think(const std::string& turn_id, uint32_t step, const std::string& text);
    void record_tool_call(const std::string& turn_id, uint32_t step, const ToolCall& call);
    void record_tool_result(const std::string& turn_id, const ToolCall& call,
                            const std::string& output, bool is_error,
                            ToolCallStatus status);
    void end_turn(const std::string& turn_id, const std::string& outcome,
                  const std::string& cause, uint32_t steps);
    void append(const Message& msg);
    void clear();

    // Replace the oldest prefix, keeping the most recent `protected_tail`
    // messages, with one summary message. The cut point moves back so a tool
    // result is never separated from the call that produced it. Returns
    // false (and emits nothing) when there is nothing new to compact.
    bool compact(size_t protected_tail, Summarizer& summarizer);

    // Fold one wire message into memory without emitting it.
    void apply(const WireMessage& msg);

    // Apply logged messages in sequence order.
    void load(const std::vector<WireMessage>& log);

    // ── Queries ─────────────────────────────────────────────────
    const std::vector<Message>& messages() const { return messages_; }
    size_t size() const { return messages_.size(); }
    bool empty() const { return messages_.empty(); }
    uint32_t estimate_tokens() const;
    uint32_t compaction_count() const { return compactions_; }
    uint32_t turn_count() const { return turns_; }
    uint64_t last_seq() const { return last_seq_; }
    const std::vector<OpenToolCall>& open_tool_calls() const { return open_calls_; }
    const std::optional<std::string>& open_turn_id() const { return open_turn_; }

    // Reconstruct a context by applying messages in sequence order.
    static Context replay(const std::vector<WireMessage>& log,
                          std::shared_ptr<const TokenEstimator> estimator = nullptr);
    static Context replay_from_log(const std::string& path,
                                   std::shared_ptr<const TokenEstimator> estimator = nullptr);

private:
    void append_assistant_part(const std::string& turn_id, uint32_t step,
                               ContentPart part, uint64_t timestamp);
    OpenToolCall* find_open_call(const std::string& id);
    void erase_open_call(const std::string& id);

    WireEmitter* wire_;
    std::shared_ptr<const TokenEstimator> estimator_;
    std::vector<Message> messages_;
    std::vector<OpenToolCall> open_calls_;
    std::optional<std::string> open_turn_;
    std::string open_step_; // "<turn>:<step>" of the assistant message being built
    uint32_t compactions_ = 0;
    uint32_t turns_ = 0;
    uint64_t last_seq_ = 0;
    uint64_t local_seq_ = 0; // numbering when no emitter is attached
};

} // namespace soulwire
