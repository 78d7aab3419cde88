#pragma once
#include "wire.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace soulwire {

using WireHandler = std::function<void(const WireMessage&)>;

// Fans emitted wire messages out to external consumers (UI, stdio
// channel, tests). Subscriptions are keyed by message type; the tag
// kAllTypes receives every message.
class WireBus {
public:
    static constexpr const char* kAllTypes = "*";

    // Subscribe to messages with a given type. Returns a subscription ID.
    uint64_t subscribe(const std::string& type, WireHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Publish synchronously. Type-specific handlers run first, then
    // wildcard handlers, each in registration order. The mutex is released
    // before calling handlers to avoid deadlocks.
    void publish(const WireMessage& msg);

    // Remove all subscriptions.
    void clear();

    // Number of subscriptions for a given type (0 if none).
    size_t subscriber_count(const std::string& type) const;

private:
    struct Subscription {
        uint64_t id;
        WireHandler handler;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    uint64_t next_id_ = 1;
};

} // namespace soulwire
