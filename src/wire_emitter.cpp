#include "wire_emitter.hpp"
#include "wire_bus.hpp"
#include "wire_log.hpp"
#include "util.hpp"

namespace soulwire {

WireEmitter::WireEmitter(std::string session_id, WireLog* log, WireBus* bus)
    : session_id_(std::move(session_id)), log_(log), bus_(bus)
{}

WireMessage WireEmitter::emit(WireKind kind, const std::string& type,
                              nlohmann::json payload,
                              const std::optional<std::string>& turn_id,
                              const std::optional<std::string>& tool_call_id) {
    WireMessage msg;
    msg.kind = kind;
    msg.type = type;
    msg.session_id = session_id_;
    msg.turn_id = turn_id;
    msg.tool_call_id = tool_call_id;
    msg.parent_tool_call_id = parent_tool_call_id_;
    msg.payload = std::move(payload);

    // Held across append and publish so consumers observe generation order.
    // Bus handlers must not emit on the same emitter.
    std::lock_guard<std::mutex> lock(mutex_);
    msg.seq = next_seq_;
    msg.timestamp = epoch_millis();
    if (log_) {
        log_->append(msg); // throws LogWriteError; seq is not consumed
    }
    next_seq_++;
    if (bus_) {
        bus_->publish(msg);
    }
    return msg;
}

void WireEmitter::resume_after(uint64_t seq) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (seq + 1 > next_seq_) next_seq_ = seq + 1;
}

uint64_t WireEmitter::last_seq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_seq_ - 1;
}

} // namespace soulwire
