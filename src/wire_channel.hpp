#pragma once
#include "approval.hpp"
#include "wire.hpp"
#include "wire_bus.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>

namespace soulwire {

class Runtime;

// Line-delimited duplex transport over a pair of streams.
//
// Outbound: every message published on the bus is written as one line.
// Inbound (reader thread): Prompt requests are queued for next_prompt(),
// Cancel requests call the cancel handler, ApprovalResponses go to the
// broker. An undecodable line reports a protocol error and closes the
// inbound side; approvals still outstanding then, or requested later, are
// answered "deny" since no client can answer them.
class WireChannel {
public:
    using CancelHandler = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string& message)>;

    WireChannel(std::istream& in, std::ostream& out, WireBus& bus, ApprovalBroker& broker);
    ~WireChannel();

    WireChannel(const WireChannel&) = delete;
    WireChannel& operator=(const WireChannel&) = delete;

    void set_cancel_handler(CancelHandler handler) { on_cancel_ = std::move(handler); }
    void set_error_handler(ErrorHandler handler) { on_error_ = std::move(handler); }

    // Start the reader thread. Handlers must be set before.
    void start();

    // Next prompt text, blocking. nullopt once the inbound side is closed
    // and every queued prompt has been handed out.
    std::optional<std::string> next_prompt();

    bool inbound_closed() const;

    // Handle one inbound line. Throws ProtocolError if it cannot be decoded.
    void handle_line(const std::string& line);

private:
    void read_loop();
    void write(const WireMessage& msg);
    void close_inbound();

    std::istream& in_;
    std::ostream& out_;
    WireBus& bus_;
    ApprovalBroker& broker_;
    uint64_t subscription_ = 0;

    CancelHandler on_cancel_;
    ErrorHandler on_error_;

    std::mutex out_mutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> prompts_;
    std::set<std::string> outstanding_;  // approval request ids awaiting a client
    bool closed_ = false;

    std::thread reader_;
};

// Drive the runtime's root soul over a channel until the inbound side
// closes. Returns a process exit code.
int run_wire_server(Runtime& runtime, std::istream& in, std::ostream& out);

} // namespace soulwire
