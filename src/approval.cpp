#include "approval.hpp"
#include <chrono>

namespace soulwire {

// ── ApprovalBroker ──────────────────────────────────────────────

void ApprovalBroker::open(const std::string& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.emplace(request_id, std::nullopt);
}

bool ApprovalBroker::respond(const std::string& request_id, ApprovalDecision decision) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(request_id);
        if (it == pending_.end() || it->second) return false;
        it->second = decision;
    }
    cv_.notify_all();
    return true;
}

std::optional<ApprovalDecision> ApprovalBroker::wait(const std::string& request_id,
                                                     const InterruptToken& interrupt) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        auto it = pending_.find(request_id);
        if (it == pending_.end()) return std::nullopt;
        if (it->second) {
            auto decision = *it->second;
            pending_.erase(it);
            return decision;
        }
        if (interrupt.is_set()) {
            pending_.erase(it);
            return std::nullopt;
        }
        // Interrupt tokens have their own condition variable; poll in slices.
        cv_.wait_for(lock, std::chrono::milliseconds(20));
    }
}

size_t ApprovalBroker::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, decision] : pending_) {
        if (!decision) count++;
    }
    return count;
}

// ── Approval ────────────────────────────────────────────────────

bool Approval::yolo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return yolo_;
}

void Approval::set_yolo(bool yolo) {
    std::lock_guard<std::mutex> lock(mutex_);
    yolo_ = yolo;
}

void Approval::allow_always(const std::string& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    always_allowed_.insert(tool_name);
}

bool Approval::is_always_allowed(const std::string& tool_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return always_allowed_.count(tool_name) > 0;
}

bool Approval::requires_approval(const std::string& name, ApprovalPolicy policy) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (policy) {
        case ApprovalPolicy::Never:
            return false;
        case ApprovalPolicy::Always:
            return !yolo_;
        case ApprovalPolicy::Session:
            return !yolo_ && always_allowed_.count(name) == 0;
    }
    return true;
}

} // namespace soulwire
