#include "console.hpp"
#include "util.hpp"
#include <iostream>

namespace soulwire {

Console::Console(WireBus& bus, ApprovalBroker& broker, std::istream& in, std::ostream& out)
    : bus_(bus), broker_(broker), in_(in), out_(out)
{
    subscriptions_.push_back(bus_.subscribe(wire_types::ApprovalRequest,
        [this](const WireMessage& msg) { ask(msg); }));
    subscriptions_.push_back(bus_.subscribe(WireBus::kAllTypes,
        [this](const WireMessage& msg) { render(msg); }));
}

Console::~Console() {
    for (auto id : subscriptions_) bus_.unsubscribe(id);
}

ApprovalDecision Console::parse_answer(const std::string& answer) {
    std::string a = trim(answer);
    if (a == "y" || a == "Y" || a == "yes") return ApprovalDecision::Approve;
    if (a == "a" || a == "A" || a == "always") return ApprovalDecision::AlwaysAllow;
    return ApprovalDecision::Deny;
}

void Console::ask(const WireMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& p = msg.payload;
    out_ << "\n" << (msg.parent_tool_call_id ? "[subagent] " : "")
         << "Allow " << p.value("tool_name", "?") << " " << p.value("arguments", "")
         << "? [y]es / [n]o / [a]lways: " << std::flush;

    std::string answer;
    if (!std::getline(in_, answer)) answer = "n";
    broker_.respond(p.value("request_id", ""), parse_answer(answer));
}

void Console::render(const WireMessage& msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& p = msg.payload;
    std::string indent = msg.parent_tool_call_id ? "    " : "";

    if (msg.is(wire_types::AssistantDelta)) {
        if (p.contains("think")) {
            out_ << indent << "(thinking) " << first_line(p.value("think", "")) << "\n";
        } else {
            out_ << indent << p.value("text", "") << "\n";
        }
    } else if (msg.is(wire_types::ToolCallStarted)) {
        out_ << indent << "-> " << p.value("name", "") << " " << p.value("arguments", "") << "\n";
    } else if (msg.is(wire_types::ToolCallResult)) {
        out_ << indent << "<- " << p.value("name", "") << " "
             << p.value("status", "") << ": " << first_line(p.value("output", "")) << "\n";
    } else if (msg.is(wire_types::TurnEnd)) {
        if (p.value("outcome", "") != "completed") {
            out_ << indent << "[turn " << p.value("outcome", "") << "] "
                 << p.value("cause", "") << "\n";
        }
    } else if (msg.is(wire_types::Error)) {
        out_ << indent << "[error] " << p.value("message", "") << "\n";
    } else if (msg.is_status(wire_status::Retrying)) {
        out_ << indent << "[retrying " << p.value("attempt", 0) << "] "
             << p.value("error", "") << "\n";
    } else if (msg.is_status(wire_status::Compacted)) {
        out_ << indent << "[compacted " << p.value("replaced", 0) << " messages]\n";
    }
    out_.flush();
}

} // namespace soulwire
