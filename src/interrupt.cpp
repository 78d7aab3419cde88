#include "interrupt.hpp"
#include <algorithm>

namespace soulwire {

// Ancestors are not notified on set(); waiters poll at this granularity.
static constexpr std::chrono::milliseconds kPollSlice{20};

InterruptToken::InterruptToken() : state_(std::make_shared<State>()) {}

InterruptToken::InterruptToken(std::shared_ptr<State> state) : state_(std::move(state)) {}

InterruptToken InterruptToken::child_of(const InterruptToken& parent) {
    auto state = std::make_shared<State>();
    state->parent = parent.state_;
    return InterruptToken(std::move(state));
}

void InterruptToken::set() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->flag.store(true);
    }
    state_->cv.notify_all();
}

void InterruptToken::reset() {
    state_->flag.store(false);
}

bool InterruptToken::is_set() const {
    for (const State* s = state_.get(); s; s = s->parent.get()) {
        if (s->flag.load()) return true;
    }
    return false;
}

bool InterruptToken::wait_for(std::chrono::milliseconds timeout) const {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(state_->mutex);
    while (!is_set()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kPollSlice);
        state_->cv.wait_for(lock, slice);
    }
    return true;
}

} // namespace soulwire
