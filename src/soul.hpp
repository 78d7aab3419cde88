#pragma once
#include "context.hpp"
#include "compaction.hpp"
#include "hub.hpp"
#include "interrupt.hpp"
#include "provider.hpp"
#include "wire_emitter.hpp"
#include "wire_log.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace soulwire {

class WireBus;

enum class SoulState {
    Idle,
    AwaitingModelResponse,
    ExecutingTools,
    AwaitingApproval,
    Completed,
    Failed,
    Interrupted
};

const char* soul_state_to_string(SoulState state);

enum class TurnOutcome { Completed, Failed, Interrupted };

const char* turn_outcome_to_string(TurnOutcome outcome);

struct TurnResult {
    TurnOutcome outcome = TurnOutcome::Completed;
    std::string cause;       // empty unless Failed or Interrupted
    std::string final_text;  // assistant text of the last step
    uint32_t steps = 0;
    std::string turn_id;
};

struct LoopControl {
    uint32_t max_steps_per_run = 100;
    uint32_t max_retries_per_step = 3;
};

// Backoff between provider retries of one step.
struct RetryPolicy {
    uint32_t base_delay_ms = 300;
    uint32_t max_delay_ms = 5000;
    double jitter = 0.25;  // fraction of the delay, applied both ways

    // Delay before retry `attempt` (1-based).
    std::chrono::milliseconds delay_for(uint32_t attempt) const;
};

struct SoulOptions {
    LoopControl loop;
    RetryPolicy retry;
    uint32_t max_context_size = 128000;
    double compaction_ratio = 0.85;
    size_t protected_tail = 10;
    std::string model;
    double temperature = 0.7;
    uint32_t depth = 0;      // 0 for the root soul
    uint32_t max_depth = 2;  // deepest subagent allowed

    uint32_t compaction_threshold() const {
        return static_cast<uint32_t>(static_cast<double>(max_context_size) * compaction_ratio);
    }
};

// One live instance of the execution engine bound to one Context.
//
// run_turn() is a single-threaded loop; other threads may only call
// interrupt() and read state(). Every state change is committed through
// the Context, which logs before applying.
class Soul {
public:
    // `log` may be null for an in-memory soul; `bus` is non-owning.
    Soul(std::string id, std::string session_id,
         std::shared_ptr<Provider> provider,
         std::shared_ptr<Approval> approval,
         SoulOptions options,
         std::unique_ptr<WireLog> log = nullptr,
         WireBus* bus = nullptr);

    Soul(const Soul&) = delete;
    Soul& operator=(const Soul&) = delete;

    TurnResult run_turn(const std::string& user_input);

    // Request cooperative cancellation. Between turns the request is held
    // and ends the next run_turn before its first model call; every turn
    // clears the flag when it returns.
    void interrupt() { interrupt_.set(); }
    // Forget an interrupt requested while no turn was running.
    void clear_interrupt() { interrupt_.reset(); }

    // Rebuild the context from a previously written log, then close what
    // the crash left open: dangling tool calls get an interrupted result
    // and an unterminated turn gets a TurnEnd.
    void restore(const std::vector<WireMessage>& log);

    // Throws FatalProviderError if the model cannot produce thinking.
    void set_thinking(bool enabled);
    bool thinking() const { return thinking_; }

    // Forced compaction. Returns false when nothing was compacted.
    bool compact_now();
    void clear();

    void set_system_prompt(std::string prompt) { system_prompt_ = std::move(prompt); }
    const std::string& system_prompt() const { return system_prompt_; }
    void set_summarizer(std::shared_ptr<Summarizer> summarizer);

    // Use an externally owned token, e.g. one linked to a parent soul.
    void set_interrupt_token(InterruptToken token) { interrupt_ = std::move(token); }
    const InterruptToken& interrupt_token() const { return interrupt_; }

    SoulState state() const { return state_.load(); }
    const std::string& id() const { return id_; }
    const std::string& session_id() const { return emitter_.session_id(); }
    uint32_t depth() const { return options_.depth; }
    const SoulOptions& options() const { return options_; }

    Context& context() { return context_; }
    const Context& context() const { return context_; }
    Hub& hub() { return hub_; }
    WireEmitter& emitter() { return emitter_; }
    Provider& provider() { return *provider_; }
    const std::shared_ptr<Provider>& provider_ptr() const { return provider_; }

private:
    ChatResponse call_provider(const std::string& turn_id, uint32_t step);
    void maybe_compact();
    void close_open_calls(ToolCallStatus status, const std::string& reason);
    TurnResult finish(TurnResult result);
    void emit_error(const std::string& turn_id, const std::string& code,
                    const std::string& message);

    std::string id_;
    std::shared_ptr<Provider> provider_;
    SoulOptions options_;
    std::unique_ptr<WireLog> log_;
    WireEmitter emitter_;
    std::shared_ptr<const TokenEstimator> estimator_;
    Context context_;
    Hub hub_;
    std::shared_ptr<Summarizer> summarizer_;
    InterruptToken interrupt_;
    std::string system_prompt_;
    bool thinking_ = false;
    std::atomic<SoulState> state_{SoulState::Idle};
};

} // namespace soulwire
