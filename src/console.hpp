#pragma once
#include "approval.hpp"
#include "wire_bus.hpp"
#include <iosfwd>
#include <mutex>
#include <vector>

namespace soulwire {

// Terminal front end for the REPL: renders wire messages as text and
// answers approval requests by asking on the console (y / n / a).
class Console {
public:
    Console(WireBus& bus, ApprovalBroker& broker, std::istream& in, std::ostream& out);
    ~Console();

    Console(const Console&) = delete;
    Console& operator=(const Console&) = delete;

    // Parse an approval answer. Returns Deny for anything unrecognized.
    static ApprovalDecision parse_answer(const std::string& answer);

private:
    void render(const WireMessage& msg);
    void ask(const WireMessage& msg);

    WireBus& bus_;
    ApprovalBroker& broker_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex mutex_;  // serializes output and prompts across subagent threads
    std::vector<uint64_t> subscriptions_;
};

} // namespace soulwire
