#include "context.hpp"
#include "wire_emitter.hpp"
#include "wire_log.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace soulwire {

Context::Context(WireEmitter* wire, std::shared_ptr<const TokenEstimator> estimator)
    : wire_(wire)
    , estimator_(estimator ? std::move(estimator) : std::make_shared<CharRatioEstimator>())
{}

WireMessage Context::commit(WireKind kind, const std::string& type,
                            nlohmann::json payload,
                            const std::optional<std::string>& turn_id,
                            const std::optional<std::string>& tool_call_id) {
    WireMessage msg;
    if (wire_) {
        msg = wire_->emit(kind, type, std::move(payload), turn_id, tool_call_id);
    } else {
        msg.kind = kind;
        msg.type = type;
        msg.seq = ++local_seq_;
        msg.turn_id = turn_id;
        msg.tool_call_id = tool_call_id;
        msg.timestamp = epoch_millis();
        msg.payload = std::move(payload);
    }
    apply(msg);
    return msg;
}

// ── Mutations ───────────────────────────────────────────────────

void Context::begin_turn(const std::string& turn_id, const std::string& user_input) {
    commit(WireKind::Event, wire_types::TurnBegin, {{"input", user_input}}, turn_id);
}

void Context::append_text(const std::string& turn_id, uint32_t step, const std::string& text) {
    commit(WireKind::Event, wire_types::AssistantDelta,
           {{"step", step}, {"text", text}}, turn_id);
}

void Context::append_think(const std::string& turn_id, uint32_t step, const std::string& text) {
    commit(WireKind::Event, wire_types::AssistantDelta,
           {{"step", step}, {"think", text}}, turn_id);
}

void Context::record_tool_call(const std::string& turn_id, uint32_t step, const ToolCall& call) {
    commit(WireKind::Event, wire_types::ToolCallStarted,
           {{"step", step}, {"name", call.name}, {"arguments", call.arguments}},
           turn_id, call.id);
}

void Context::record_tool_result(const std::string& turn_id, const ToolCall& call,
                                 const std::string& output, bool is_error,
                                 ToolCallStatus status) {
    commit(WireKind::Event, wire_types::ToolCallResult,
           {{"name", call.name},
            {"output", output},
            {"is_error", is_error},
            {"status", tool_call_status_to_string(status)}},
           turn_id, call.id);
}

void Context::end_turn(const std::string& turn_id, const std::string& outcome,
                       const std::string& cause, uint32_t steps) {
    nlohmann::json payload = {{"outcome", outcome}, {"steps", steps}};
    if (!cause.empty()) payload["cause"] = cause;
    commit(WireKind::Event, wire_types::TurnEnd, std::move(payload), turn_id);
}

void Context::append(const Message& msg) {
    commit(WireKind::Event, wire_types::StatusUpdate,
           {{"status", wire_status::Appended}, {"message", message_to_json(msg)}});
}

void Context::clear() {
    commit(WireKind::Event, wire_types::StatusUpdate, {{"status", wire_status::Cleared}});
}

bool Context::compact(size_t protected_tail, Summarizer& summarizer) {
    if (messages_.size() <= protected_tail) return false;

    size_t keep_from = messages_.size() - protected_tail;
    // Walk back if we'd start on a Tool message so a call stays with its results
    while (keep_from > 0 && keep_from < messages_.size() &&
           messages_[keep_from].role == Role::Tool) {
        keep_from--;
    }
    if (keep_from == 0) return false;
    if (keep_from == 1 && messages_[0].summary) return false;

    std::vector<Message> prefix(messages_.begin(),
                                messages_.begin() + static_cast<std::ptrdiff_t>(keep_from));
    Message summary;
    summary.role = Role::User;
    summary.summary = true;
    summary.parts.push_back(ContentPart::make_text(summarizer.summarize(prefix)));

    uint32_t before = estimate_tokens();
    commit(WireKind::Event, wire_types::StatusUpdate,
           {{"status", wire_status::Compacted},
            {"replaced", keep_from},
            {"summary", message_to_json(summary)}});
    std::cerr << "[compact] Replaced " << keep_from << " messages with a summary ("
              << before << " -> " << estimate_tokens() << " tokens)\n";
    return true;
}

// ── Apply ───────────────────────────────────────────────────────

void Context::append_assistant_part(const std::string& turn_id, uint32_t step,
                                    ContentPart part, uint64_t timestamp) {
    std::string key = turn_id + ":" + std::to_string(step);
    if (open_step_ != key || messages_.empty() || messages_.back().role != Role::Assistant) {
        Message msg;
        msg.role = Role::Assistant;
        msg.created_at = timestamp;
        messages_.push_back(std::move(msg));
        open_step_ = key;
    }
    messages_.back().parts.push_back(std::move(part));
}

OpenToolCall* Context::find_open_call(const std::string& id) {
    for (auto& oc : open_calls_) {
        if (oc.call.id == id) return &oc;
    }
    return nullptr;
}

void Context::erase_open_call(const std::string& id) {
    open_calls_.erase(std::remove_if(open_calls_.begin(), open_calls_.end(),
        [&id](const OpenToolCall& oc) { return oc.call.id == id; }), open_calls_.end());
}

void Context::apply(const WireMessage& msg) {
    last_seq_ = std::max(last_seq_, msg.seq);
    const auto& p = msg.payload;
    std::string turn_id = msg.turn_id.value_or("");

    if (msg.is(wire_types::AssistantDelta)) {
        uint32_t step = p.value("step", 0u);
        if (p.contains("think")) {
            append_assistant_part(turn_id, step,
                                  ContentPart::make_think(p.value("think", "")), msg.timestamp);
        } else {
            append_assistant_part(turn_id, step,
                                  ContentPart::make_text(p.value("text", "")), msg.timestamp);
        }
        return;
    }
    if (msg.is(wire_types::ToolCallStarted)) {
        ToolCall call{msg.tool_call_id.value_or(""), p.value("name", ""),
                      p.value("arguments", "{}")};
        append_assistant_part(turn_id, p.value("step", 0u),
                              ContentPart::make_call(call), msg.timestamp);
        open_calls_.push_back(OpenToolCall{call, turn_id, ToolCallStatus::Pending});
        return;
    }
    if (msg.is(wire_types::ApprovalRequest)) {
        if (auto* oc = find_open_call(msg.tool_call_id.value_or(""))) {
            oc->status = ToolCallStatus::AwaitingApproval;
        }
        return;
    }
    if (msg.is(wire_types::ApprovalResponse)) {
        if (auto* oc = find_open_call(msg.tool_call_id.value_or(""))) {
            oc->status = p.value("decision", "deny") == "deny"
                ? ToolCallStatus::Denied : ToolCallStatus::Approved;
        }
        return;
    }

    // Everything below ends the assistant message under construction.
    if (msg.is(wire_types::TurnBegin)) {
        open_step_.clear();
        Message user;
        user.role = Role::User;
        user.created_at = msg.timestamp;
        user.parts.push_back(ContentPart::make_text(p.value("input", "")));
        messages_.push_back(std::move(user));
        open_turn_ = turn_id;
        turns_++;
    } else if (msg.is(wire_types::ToolCallResult)) {
        open_step_.clear();
        ToolCall call{msg.tool_call_id.value_or(""), p.value("name", ""), ""};
        Message tool;
        tool.role = Role::Tool;
        tool.created_at = msg.timestamp;
        tool.parts.push_back(ContentPart::make_result(call, p.value("output", ""),
                                                      p.value("is_error", false)));
        messages_.push_back(std::move(tool));
        erase_open_call(call.id);
    } else if (msg.is(wire_types::TurnEnd)) {
        open_step_.clear();
        open_turn_.reset();
    } else if (msg.is_status(wire_status::Compacted)) {
        open_step_.clear();
        size_t replaced = std::min<size_t>(p.value("replaced", size_t{0}), messages_.size());
        Message summary = message_from_json(p.value("summary", nlohmann::json::object()));
        summary.summary = true;
        summary.created_at = msg.timestamp;
        messages_.erase(messages_.begin(),
                        messages_.begin() + static_cast<std::ptrdiff_t>(replaced));
        messages_.insert(messages_.begin(), std::move(summary));
        compactions_++;
    } else if (msg.is_status(wire_status::Cleared)) {
        open_step_.clear();
        messages_.clear();
        open_calls_.clear();
    } else if (msg.is_status(wire_status::Appended)) {
        open_step_.clear();
        Message appended = message_from_json(p.value("message", nlohmann::json::object()));
        if (appended.created_at == 0) appended.created_at = msg.timestamp;
        messages_.push_back(std::move(appended));
    }
}

// ── Queries ─────────────────────────────────────────────────────

uint32_t Context::estimate_tokens() const {
    return estimator_->estimate(messages_);
}

void Context::load(const std::vector<WireMessage>& log) {
    std::vector<const WireMessage*> ordered;
    ordered.reserve(log.size());
    for (const auto& msg : log) ordered.push_back(&msg);
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const WireMessage* a, const WireMessage* b) { return a->seq < b->seq; });

    for (const auto* msg : ordered) {
        apply(*msg);
    }
    local_seq_ = std::max(local_seq_, last_seq_);
}

Context Context::replay(const std::vector<WireMessage>& log,
                        std::shared_ptr<const TokenEstimator> estimator) {
    Context ctx(nullptr, std::move(estimator));
    ctx.load(log);
    return ctx;
}

Context Context::replay_from_log(const std::string& path,
                                 std::shared_ptr<const TokenEstimator> estimator) {
    return replay(WireLog::read(path), std::move(estimator));
}

} // namespace soulwire
