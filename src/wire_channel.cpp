#include "wire_channel.hpp"
#include "errors.hpp"
#include "runtime.hpp"
#include <iostream>

namespace soulwire {

WireChannel::WireChannel(std::istream& in, std::ostream& out, WireBus& bus,
                         ApprovalBroker& broker)
    : in_(in), out_(out), bus_(bus), broker_(broker)
{
    subscription_ = bus_.subscribe(WireBus::kAllTypes,
                                   [this](const WireMessage& msg) { write(msg); });
}

WireChannel::~WireChannel() {
    bus_.unsubscribe(subscription_);
    if (reader_.joinable()) reader_.join();
}

void WireChannel::start() {
    reader_ = std::thread([this]() { read_loop(); });
}

void WireChannel::write(const WireMessage& msg) {
    // Subagent approvals reach the client through the same bus.
    if (msg.kind == WireKind::Request && msg.is(wire_types::ApprovalRequest)) {
        std::string request_id = msg.payload.value("request_id", "");
        bool deny = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) deny = true;
            else outstanding_.insert(request_id);
        }
        if (deny) {
            broker_.respond(request_id, ApprovalDecision::Deny);
        }
    }

    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << encode_wire_message(msg) << '\n';
    out_.flush();
}

void WireChannel::handle_line(const std::string& line) {
    auto decoded = decode_wire_message(line);
    if (!decoded) return; // unknown kind or type

    const WireMessage& msg = *decoded;
    if (msg.kind == WireKind::Request && msg.is(wire_types::Prompt)) {
        if (!msg.payload.contains("text") || !msg.payload["text"].is_string()) {
            throw ProtocolError("Prompt without a text field");
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            prompts_.push_back(msg.payload["text"].get<std::string>());
        }
        cv_.notify_all();
    } else if (msg.kind == WireKind::Request && msg.is(wire_types::Cancel)) {
        if (on_cancel_) on_cancel_();
    } else if (msg.kind == WireKind::Response && msg.is(wire_types::ApprovalResponse)) {
        std::string request_id = msg.payload.value("request_id", "");
        if (request_id.empty()) {
            throw ProtocolError("ApprovalResponse without a request_id");
        }
        auto decision = approval_decision_from_string(msg.payload.value("decision", ""));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            outstanding_.erase(request_id);
        }
        if (!broker_.respond(request_id, decision)) {
            std::cerr << "[channel] No pending approval request " << request_id << '\n';
        }
    }
}

void WireChannel::read_loop() {
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;
        try {
            handle_line(line);
        } catch (const ProtocolError& e) {
            std::cerr << "[channel] Protocol error, closing inbound channel: " << e.what() << '\n';
            if (on_error_) on_error_(e.what());
            break;
        }
    }
    close_inbound();
}

void WireChannel::close_inbound() {
    std::set<std::string> outstanding;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        outstanding.swap(outstanding_);
    }
    cv_.notify_all();
    for (const auto& id : outstanding) {
        broker_.respond(id, ApprovalDecision::Deny);
    }
}

std::optional<std::string> WireChannel::next_prompt() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !prompts_.empty() || closed_; });
    if (prompts_.empty()) return std::nullopt;
    std::string prompt = std::move(prompts_.front());
    prompts_.pop_front();
    return prompt;
}

bool WireChannel::inbound_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

int run_wire_server(Runtime& runtime, std::istream& in, std::ostream& out) {
    Soul& soul = runtime.soul();
    WireChannel channel(in, out, runtime.bus(), runtime.approval().broker());
    channel.set_cancel_handler([&soul]() { soul.interrupt(); });
    channel.set_error_handler([&soul](const std::string& message) {
        soul.emitter().event(wire_types::Error,
                             {{"code", "protocol_error"}, {"message", message}});
    });
    channel.start();

    while (auto prompt = channel.next_prompt()) {
        soul.run_turn(*prompt);
    }
    return 0;
}

} // namespace soulwire
