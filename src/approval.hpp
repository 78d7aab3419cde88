#pragma once
#include "tool.hpp"
#include "wire.hpp"
#include "interrupt.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <condition_variable>
#include <memory>

namespace soulwire {

// Rendezvous between an ApprovalRequest waiting on the Soul's thread and
// the ApprovalResponse delivered by a UI or wire client on another thread.
class ApprovalBroker {
public:
    // Register a request before it is emitted so an immediate response
    // is not lost.
    void open(const std::string& request_id);

    // Deliver a decision. Returns false if no such request is pending.
    bool respond(const std::string& request_id, ApprovalDecision decision);

    // Block until the request is answered. Returns nullopt if the token is
    // interrupted first; the request is closed either way.
    std::optional<ApprovalDecision> wait(const std::string& request_id,
                                         const InterruptToken& interrupt);

    size_t pending_count() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::optional<ApprovalDecision>> pending_;
};

// Session-scoped approval policy, shared by a root Soul and its subagents.
class Approval {
public:
    explicit Approval(bool yolo = false) : yolo_(yolo) {}

    bool yolo() const;
    void set_yolo(bool yolo);

    void allow_always(const std::string& tool_name);
    bool is_always_allowed(const std::string& tool_name) const;

    // `name` is the name the tool is registered under in the Hub, the same
    // key allow_always() records.
    bool requires_approval(const std::string& name, ApprovalPolicy policy) const;

    ApprovalBroker& broker() { return broker_; }

private:
    mutable std::mutex mutex_;
    bool yolo_;
    std::unordered_set<std::string> always_allowed_;
    ApprovalBroker broker_;
};

} // namespace soulwire
