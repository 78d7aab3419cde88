#include "wire_bus.hpp"

namespace soulwire {

uint64_t WireBus::subscribe(const std::string& type, WireHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[type].push_back(Subscription{id, std::move(handler)});
    return id;
}

bool WireBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [type, subs] : handlers_) {
        for (auto it = subs.begin(); it != subs.end(); ++it) {
            if (it->id == id) {
                subs.erase(it);
                return true;
            }
        }
    }
    return false;
}

void WireBus::publish(const WireMessage& msg) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<WireHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(msg.type);
        if (it != handlers_.end()) {
            for (const auto& sub : it->second) {
                to_call.push_back(sub.handler);
            }
        }
        auto all = handlers_.find(kAllTypes);
        if (all != handlers_.end()) {
            for (const auto& sub : all->second) {
                to_call.push_back(sub.handler);
            }
        }
    }
    for (const auto& handler : to_call) {
        handler(msg);
    }
}

void WireBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.clear();
}

size_t WireBus::subscriber_count(const std::string& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(type);
    if (it == handlers_.end()) return 0;
    return it->second.size();
}

} // namespace soulwire
