#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace soulwire {

// Cooperative cancellation flag threaded through every blocking call.
// Copies share state. A child token also reports set when any ancestor
// is set, so interrupting a parent reaches in-flight subagents.
class InterruptToken {
public:
    InterruptToken();

    static InterruptToken child_of(const InterruptToken& parent);

    void set();
    void reset();
    bool is_set() const;

    // Sleep up to `timeout`, waking early on interruption.
    // Returns true if interrupted.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    struct State {
        std::atomic<bool> flag{false};
        std::mutex mutex;
        std::condition_variable cv;
        std::shared_ptr<State> parent;
    };

    explicit InterruptToken(std::shared_ptr<State> state);

    std::shared_ptr<State> state_;
};

} // namespace soulwire
