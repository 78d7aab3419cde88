#include <catch2/catch.hpp>
#include "wire_channel.hpp"
#include "errors.hpp"
#include <sstream>

using namespace soulwire;

static std::string request_line(const char* type, const nlohmann::json& payload) {
    WireMessage msg;
    msg.kind = WireKind::Request;
    msg.type = type;
    msg.payload = payload;
    return encode_wire_message(msg);
}

static std::string response_line(const std::string& request_id, const char* decision) {
    WireMessage msg;
    msg.kind = WireKind::Response;
    msg.type = wire_types::ApprovalResponse;
    msg.payload = {{"request_id", request_id}, {"decision", decision}};
    return encode_wire_message(msg);
}

static WireMessage approval_request(const std::string& request_id) {
    WireMessage msg;
    msg.kind = WireKind::Request;
    msg.type = wire_types::ApprovalRequest;
    msg.payload = {{"request_id", request_id}, {"tool_name", "shell"}};
    return msg;
}

// ── Inbound ─────────────────────────────────────────────────────

TEST_CASE("WireChannel: prompts are queued in order", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);

    channel.handle_line(request_line(wire_types::Prompt, {{"text", "first"}}));
    channel.handle_line(request_line(wire_types::Prompt, {{"text", "second"}}));

    REQUIRE(channel.next_prompt() == std::string("first"));
    REQUIRE(channel.next_prompt() == std::string("second"));
}

TEST_CASE("WireChannel: prompt without text is a protocol error", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);

    REQUIRE_THROWS_AS(channel.handle_line(request_line(wire_types::Prompt, {{"txt", "x"}})),
                      ProtocolError);
    REQUIRE_THROWS_AS(channel.handle_line("not a wire message"), ProtocolError);
}

TEST_CASE("WireChannel: cancel calls the handler", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);
    int cancels = 0;
    channel.set_cancel_handler([&cancels]() { cancels++; });

    channel.handle_line(request_line(wire_types::Cancel, nlohmann::json::object()));

    REQUIRE(cancels == 1);
}

TEST_CASE("WireChannel: approval responses reach the broker", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);
    broker.open("r1");

    channel.handle_line(response_line("r1", "always_allow"));

    InterruptToken token;
    REQUIRE(broker.wait("r1", token) == ApprovalDecision::AlwaysAllow);
}

TEST_CASE("WireChannel: malformed approval responses are protocol errors", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);

    REQUIRE_THROWS_AS(channel.handle_line(response_line("", "approve")), ProtocolError);
    REQUIRE_THROWS_AS(channel.handle_line(response_line("r1", "perhaps")), ProtocolError);
}

TEST_CASE("WireChannel: unknown message types are ignored", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);

    channel.handle_line(R"({"kind":"request","type":"Telemetry","payload":{}})");
    REQUIRE_FALSE(channel.inbound_closed());
}

// ── Outbound ────────────────────────────────────────────────────

TEST_CASE("WireChannel: every bus message is written as one line", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);

    WireMessage msg;
    msg.type = wire_types::TurnBegin;
    msg.seq = 1;
    msg.payload = {{"input", "hi"}};
    bus.publish(msg);
    msg.type = wire_types::TurnEnd;
    msg.seq = 2;
    bus.publish(msg);

    std::istringstream lines(out.str());
    std::string line;
    std::vector<std::string> types;
    while (std::getline(lines, line)) {
        auto decoded = decode_wire_message(line);
        REQUIRE(decoded.has_value());
        types.push_back(decoded->type);
    }
    REQUIRE(types == std::vector<std::string>{"TurnBegin", "TurnEnd"});
}

// ── Reader thread ───────────────────────────────────────────────

TEST_CASE("WireChannel: protocol error closes the inbound side", "[channel]") {
    std::istringstream in(request_line(wire_types::Prompt, {{"text", "hello"}}) + "\n" +
                          "{broken\n" +
                          request_line(wire_types::Prompt, {{"text", "ignored"}}) + "\n");
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);
    std::string error;
    channel.set_error_handler([&error](const std::string& message) { error = message; });
    channel.start();

    REQUIRE(channel.next_prompt() == std::string("hello"));
    REQUIRE_FALSE(channel.next_prompt().has_value());
    REQUIRE(channel.inbound_closed());
    REQUIRE(error.find("malformed") != std::string::npos);
}

TEST_CASE("WireChannel: outstanding approvals are denied when input ends", "[channel]") {
    std::istringstream in;
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);
    broker.open("r1");
    bus.publish(approval_request("r1"));
    channel.start();

    REQUIRE_FALSE(channel.next_prompt().has_value());
    InterruptToken token;
    REQUIRE(broker.wait("r1", token) == ApprovalDecision::Deny);

    // Requests raised after the close are answered immediately
    broker.open("r2");
    bus.publish(approval_request("r2"));
    REQUIRE(broker.wait("r2", token) == ApprovalDecision::Deny);
}

TEST_CASE("WireChannel: answered approvals are not denied on close", "[channel]") {
    std::istringstream in(response_line("r1", "approve") + "\n");
    std::ostringstream out;
    WireBus bus;
    ApprovalBroker broker;
    WireChannel channel(in, out, bus, broker);
    broker.open("r1");
    bus.publish(approval_request("r1"));
    channel.start();

    REQUIRE_FALSE(channel.next_prompt().has_value());
    InterruptToken token;
    REQUIRE(broker.wait("r1", token) == ApprovalDecision::Approve);
}
