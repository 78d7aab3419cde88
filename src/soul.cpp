#include "soul.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>

namespace soulwire {

const char* soul_state_to_string(SoulState state) {
    switch (state) {
        case SoulState::Idle: return "idle";
        case SoulState::AwaitingModelResponse: return "awaiting_model_response";
        case SoulState::ExecutingTools: return "executing_tools";
        case SoulState::AwaitingApproval: return "awaiting_approval";
        case SoulState::Completed: return "completed";
        case SoulState::Failed: return "failed";
        case SoulState::Interrupted: return "interrupted";
    }
    return "idle";
}

const char* turn_outcome_to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::Completed: return "completed";
        case TurnOutcome::Failed: return "failed";
        case TurnOutcome::Interrupted: return "interrupted";
    }
    return "failed";
}

std::chrono::milliseconds RetryPolicy::delay_for(uint32_t attempt) const {
    double delay = static_cast<double>(base_delay_ms) *
                   std::pow(2.0, static_cast<double>(attempt > 0 ? attempt - 1 : 0));
    delay = std::min(delay, static_cast<double>(max_delay_ms));
    if (jitter > 0.0) {
        thread_local std::mt19937 rng(std::random_device{}());
        std::uniform_real_distribution<double> dist(1.0 - jitter, 1.0 + jitter);
        delay *= dist(rng);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::max(0.0, delay)));
}

Soul::Soul(std::string id, std::string session_id,
           std::shared_ptr<Provider> provider,
           std::shared_ptr<Approval> approval,
           SoulOptions options,
           std::unique_ptr<WireLog> log,
           WireBus* bus)
    : id_(std::move(id))
    , provider_(std::move(provider))
    , options_(std::move(options))
    , log_(std::move(log))
    , emitter_(std::move(session_id), log_.get(), bus)
    , estimator_(std::make_shared<CharRatioEstimator>())
    , context_(&emitter_, estimator_)
    , hub_(std::move(approval))
    , summarizer_(std::make_shared<CountingSummarizer>())
{
    if (!provider_) {
        throw std::invalid_argument("Soul requires a provider");
    }
    hub_.set_emitter([this](WireKind kind, const std::string& type, nlohmann::json payload,
                            const std::optional<std::string>& turn_id,
                            const std::optional<std::string>& tool_call_id) {
        if (type == wire_types::ApprovalRequest) {
            state_ = SoulState::AwaitingApproval;
        } else if (type == wire_types::ApprovalResponse) {
            state_ = SoulState::ExecutingTools;
        }
        return context_.commit(kind, type, std::move(payload), turn_id, tool_call_id);
    });
}

void Soul::set_summarizer(std::shared_ptr<Summarizer> summarizer) {
    if (summarizer) summarizer_ = std::move(summarizer);
}

void Soul::set_thinking(bool enabled) {
    if (enabled && !provider_->capabilities(options_.model).thinking) {
        throw FatalProviderError("model does not support thinking");
    }
    thinking_ = enabled;
}

// ── Turn loop ───────────────────────────────────────────────────

TurnResult Soul::run_turn(const std::string& user_input) {
    struct ClearOnExit {
        InterruptToken& token;
        ~ClearOnExit() { token.reset(); }
    } clear_on_exit{interrupt_};
    state_ = SoulState::Idle;

    TurnResult result;
    result.turn_id = generate_id();
    const std::string& turn_id = result.turn_id;
    context_.begin_turn(turn_id, user_input);

    while (true) {
        if (interrupt_.is_set()) {
            result.outcome = TurnOutcome::Interrupted;
            result.cause = "interrupted by user";
            return finish(std::move(result));
        }
        if (result.steps >= options_.loop.max_steps_per_run) {
            result.outcome = TurnOutcome::Failed;
            result.cause = "step budget exceeded (" +
                           std::to_string(options_.loop.max_steps_per_run) + " steps)";
            return finish(std::move(result));
        }
        uint32_t step = ++result.steps;

        maybe_compact();

        state_ = SoulState::AwaitingModelResponse;
        ChatResponse response;
        try {
            response = call_provider(turn_id, step);
        } catch (const TransientProviderError& e) {
            if (interrupt_.is_set()) {
                result.outcome = TurnOutcome::Interrupted;
                result.cause = "interrupted by user";
            } else {
                result.outcome = TurnOutcome::Failed;
                result.cause = std::string("provider failed after ") +
                               std::to_string(options_.loop.max_retries_per_step) +
                               " retries: " + e.what();
            }
            return finish(std::move(result));
        } catch (const FatalProviderError& e) {
            result.outcome = TurnOutcome::Failed;
            result.cause = std::string("provider error: ") + e.what();
            return finish(std::move(result));
        }

        if (interrupt_.is_set()) {
            result.outcome = TurnOutcome::Interrupted;
            result.cause = "interrupted by user";
            return finish(std::move(result));
        }

        if (response.thinking && !response.thinking->empty()) {
            context_.append_think(turn_id, step, *response.thinking);
        }
        if (response.content && !response.content->empty()) {
            context_.append_text(turn_id, step, *response.content);
            result.final_text = *response.content;
        }

        if (!response.has_tool_calls()) {
            result.outcome = TurnOutcome::Completed;
            return finish(std::move(result));
        }

        for (auto& call : response.tool_calls) {
            if (call.id.empty()) call.id = "call_" + generate_id();
            if (call.arguments.empty()) call.arguments = "{}";
            context_.record_tool_call(turn_id, step, call);
        }

        state_ = SoulState::ExecutingTools;
        try {
            hub_.dispatch_all(response.tool_calls, turn_id, interrupt_,
                [this, &turn_id](const Dispatch& d) {
                    context_.record_tool_result(turn_id, d.call, d.result.output,
                                                !d.result.success, d.status);
                });
        } catch (const HubError& e) {
            std::cerr << "[soul] " << e.what() << '\n';
            emit_error(turn_id, "hub_error", e.what());
            close_open_calls(ToolCallStatus::Failed, e.what());
            result.outcome = TurnOutcome::Failed;
            result.cause = e.what();
            return finish(std::move(result));
        }

        if (interrupt_.is_set()) {
            result.outcome = TurnOutcome::Interrupted;
            result.cause = "interrupted by user";
            return finish(std::move(result));
        }
    }
}

ChatResponse Soul::call_provider(const std::string& turn_id, uint32_t step) {
    CompletionOptions opts{options_.model, options_.temperature, thinking_};
    auto tools = hub_.specs();

    uint32_t attempt = 0;
    while (true) {
        try {
            ChatResponse response = provider_->chat(system_prompt_, context_.messages(),
                                                    tools, opts, interrupt_);
            if (response.empty()) {
                throw TransientProviderError("empty response from provider");
            }
            return response;
        } catch (const TransientProviderError& e) {
            if (interrupt_.is_set() || attempt >= options_.loop.max_retries_per_step) {
                throw;
            }
            attempt++;
            auto delay = options_.retry.delay_for(attempt);
            std::cerr << "[soul] Step " << step << " attempt " << attempt << "/"
                      << options_.loop.max_retries_per_step << " failed: " << e.what()
                      << " (retrying in " << delay.count() << "ms)\n";
            context_.commit(WireKind::Event, wire_types::StatusUpdate,
                            {{"status", wire_status::Retrying},
                             {"attempt", attempt},
                             {"error", e.what()},
                             {"delay_ms", delay.count()}},
                            turn_id);
            if (interrupt_.wait_for(delay)) {
                throw TransientProviderError("interrupted during retry backoff");
            }
        }
    }
}

void Soul::maybe_compact() {
    uint32_t tokens = context_.estimate_tokens();
    if (tokens <= options_.compaction_threshold()) return;
    context_.compact(options_.protected_tail, *summarizer_);
}

bool Soul::compact_now() {
    return context_.compact(options_.protected_tail, *summarizer_);
}

void Soul::clear() {
    context_.clear();
}

void Soul::close_open_calls(ToolCallStatus status, const std::string& reason) {
    // Copy: recording a result erases the entry.
    auto open = context_.open_tool_calls();
    for (const auto& oc : open) {
        context_.record_tool_result(oc.turn_id, oc.call, reason, true, status);
    }
}

void Soul::emit_error(const std::string& turn_id, const std::string& code,
                      const std::string& message) {
    context_.commit(WireKind::Event, wire_types::Error,
                    {{"code", code}, {"message", message}}, turn_id);
}

TurnResult Soul::finish(TurnResult result) {
    if (result.outcome == TurnOutcome::Interrupted) {
        close_open_calls(ToolCallStatus::Interrupted, "Tool call interrupted by user");
    }
    context_.end_turn(result.turn_id, turn_outcome_to_string(result.outcome),
                      result.cause, result.steps);

    switch (result.outcome) {
        case TurnOutcome::Completed: state_ = SoulState::Completed; break;
        case TurnOutcome::Failed: state_ = SoulState::Failed; break;
        case TurnOutcome::Interrupted: state_ = SoulState::Interrupted; break;
    }
    if (result.outcome != TurnOutcome::Completed) {
        std::cerr << "[soul] " << id_ << " turn " << turn_outcome_to_string(result.outcome)
                  << ": " << result.cause << '\n';
    }
    return result;
}

// ── Resume ──────────────────────────────────────────────────────

void Soul::restore(const std::vector<WireMessage>& log) {
    context_.load(log);
    emitter_.resume_after(context_.last_seq());

    if (!context_.open_tool_calls().empty()) {
        std::cerr << "[session] Closing " << context_.open_tool_calls().size()
                  << " tool call(s) left open by the previous run\n";
        close_open_calls(ToolCallStatus::Interrupted,
                         "Tool call interrupted before completion; not retried");
    }
    if (auto open_turn = context_.open_turn_id()) {
        context_.end_turn(*open_turn, turn_outcome_to_string(TurnOutcome::Interrupted),
                          "session ended before the turn finished", 0);
    }
    state_ = SoulState::Idle;
}

} // namespace soulwire
