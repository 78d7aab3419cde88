#include <catch2/catch.hpp>
#include "runtime.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "wire_channel.hpp"
#include "wire_log.hpp"
#include "tools/shell.hpp"
#include "mock_provider.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace soulwire;

// Temp share and work dirs, removed at scope exit
struct RuntimeDirs {
    std::string share = make_temp_dir();
    std::string work = make_temp_dir();

    RuntimeOptions options(bool continue_last = false) const {
        RuntimeOptions opts;
        opts.work_dir = work;
        opts.share_dir = share;
        opts.continue_last = continue_last;
        return opts;
    }

    ~RuntimeDirs() {
        std::filesystem::remove_all(share);
        std::filesystem::remove_all(work);
    }
};

static Config quick_config() {
    Config cfg;
    cfg.retry.base_delay_ms = 0;
    cfg.retry.max_delay_ms = 0;
    cfg.retry.jitter = 0.0;
    cfg.lock_timeout_ms = 100;
    return cfg;
}

static std::vector<std::string> line_types(const std::string& text) {
    std::vector<std::string> types;
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        auto msg = decode_wire_message(line);
        if (msg) types.push_back(msg->type);
    }
    return types;
}

// ── Construction ────────────────────────────────────────────────

TEST_CASE("Runtime: new session for the work dir", "[runtime]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    Runtime runtime(quick_config(), provider, dirs.options());

    REQUIRE_FALSE(runtime.resumed());
    REQUIRE(runtime.session().work_dir == SessionStore::normalize_work_dir(dirs.work));
    REQUIRE(runtime.soul().id() == "root");
    REQUIRE(runtime.arena().get("root") == &runtime.soul());
    REQUIRE(runtime.soul().system_prompt().find(runtime.session().work_dir) != std::string::npos);
    REQUIRE(runtime.soul().system_prompt().find("${") == std::string::npos);
}

TEST_CASE("Runtime: root soul gets the tools its agent spec selects", "[runtime]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    std::vector<std::shared_ptr<Tool>> tools = {
        std::make_shared<CountingTool>("shell"),
        std::make_shared<CountingTool>("file_read"),
        std::make_shared<CountingTool>("web_fetch"),
    };
    Runtime runtime(quick_config(), provider, dirs.options(), default_agent_spec(), tools);

    auto& hub = runtime.soul().hub();
    REQUIRE(hub.has_tool("shell"));
    REQUIRE(hub.has_tool("file_read"));
    REQUIRE(hub.has_tool("task"));
    REQUIRE_FALSE(hub.has_tool("web_fetch"));
    REQUIRE_FALSE(hub.has_tool("file_write"));
}

TEST_CASE("Runtime: no subagents, no task tool", "[runtime]") {
    RuntimeDirs dirs;
    AgentSpec spec;
    spec.name = "plain";
    spec.system_prompt = "plain agent";
    Runtime runtime(quick_config(), std::make_shared<MockProvider>(), dirs.options(), spec,
                    {std::make_shared<CountingTool>("lookup")});

    REQUIRE(runtime.soul().hub().has_tool("lookup"));
    REQUIRE_FALSE(runtime.soul().hub().has_tool("task"));
    REQUIRE(runtime.soul().system_prompt() == "plain agent");
}

TEST_CASE("Runtime: yolo from options or config", "[runtime]") {
    RuntimeDirs dirs;
    auto opts = dirs.options();
    opts.yolo = true;
    {
        Runtime runtime(quick_config(), std::make_shared<MockProvider>(), opts);
        REQUIRE(runtime.approval().yolo());
    }
    auto cfg = quick_config();
    cfg.yolo = true;
    Runtime runtime(cfg, std::make_shared<MockProvider>(), dirs.options());
    REQUIRE(runtime.approval().yolo());
}

// ── Sessions ────────────────────────────────────────────────────

TEST_CASE("Runtime: turns are written to the session log", "[runtime]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    provider->push(text_response("hi back"));
    Runtime runtime(quick_config(), provider, dirs.options());

    auto result = runtime.soul().run_turn("hi");
    REQUIRE(result.outcome == TurnOutcome::Completed);

    auto log = WireLog::read(runtime.session().log_path);
    REQUIRE(log.size() >= 3);
    REQUIRE(log.front().type == wire_types::TurnBegin);
    REQUIRE(log.back().type == wire_types::TurnEnd);
}

TEST_CASE("Runtime: continue resumes the last session", "[runtime]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    provider->push(text_response("first answer"));
    std::string session_id;
    size_t messages = 0;
    {
        Runtime first(quick_config(), provider, dirs.options());
        first.soul().run_turn("first question");
        session_id = first.session().id;
        messages = first.soul().context().size();
    }

    Runtime second(quick_config(), provider, dirs.options(true));
    REQUIRE(second.resumed());
    REQUIRE(second.session().id == session_id);
    REQUIRE(second.soul().context().size() == messages);
    REQUIRE(second.soul().context().messages().front().text() == "first question");

    // The resumed log keeps counting
    uint64_t before = second.soul().context().last_seq();
    provider->push(text_response("second answer"));
    second.soul().run_turn("second question");
    auto log = WireLog::read(second.session().log_path);
    REQUIRE(log.back().seq > before);
    for (size_t i = 1; i < log.size(); i++) {
        REQUIRE(log[i].seq == log[i - 1].seq + 1);
    }
}

TEST_CASE("Runtime: resuming past a torn log line keeps later turns", "[runtime]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    provider->push(text_response("first answer"));
    std::string log_path;
    {
        Runtime first(quick_config(), provider, dirs.options());
        first.soul().run_turn("first question");
        log_path = first.session().log_path;
    }
    {
        // Crash in the middle of an append
        std::ofstream f(log_path, std::ios::app);
        f << R"({"kind":"event","type":"Turn)";
    }
    {
        Runtime second(quick_config(), provider, dirs.options(true));
        REQUIRE(second.resumed());
        provider->push(text_response("second answer"));
        second.soul().run_turn("second question");
    }

    Runtime third(quick_config(), provider, dirs.options(true));
    REQUIRE(third.soul().context().turn_count() == 2);
    REQUIRE(third.soul().context().messages().back().text() == "second answer");
    auto log = WireLog::read(log_path);
    for (size_t i = 1; i < log.size(); i++) {
        REQUIRE(log[i].seq == log[i - 1].seq + 1);
    }
}

TEST_CASE("Runtime: continue without history starts fresh", "[runtime]") {
    RuntimeDirs dirs;
    Runtime runtime(quick_config(), std::make_shared<MockProvider>(), dirs.options(true));
    REQUIRE_FALSE(runtime.resumed());
    REQUIRE(runtime.soul().context().empty());
}

TEST_CASE("Runtime: a held session is busy", "[runtime]") {
    RuntimeDirs dirs;
    std::string session_dir;
    {
        Runtime first(quick_config(), std::make_shared<MockProvider>(), dirs.options());
        session_dir = first.session().dir;
    }
    SessionLock holder(session_dir, std::chrono::milliseconds(100));
    REQUIRE_THROWS_AS(
        Runtime(quick_config(), std::make_shared<MockProvider>(), dirs.options(true)),
        SessionBusyError);
}

// ── Echo provider end to end ────────────────────────────────────

TEST_CASE("Runtime: echo provider runs a shell command", "[runtime][echo]") {
    RuntimeDirs dirs;
    auto cfg = quick_config();
    cfg.yolo = true;
    auto provider = PluginRegistry::instance().create_provider("echo", cfg);
    Runtime runtime(cfg, provider, dirs.options(), default_agent_spec(),
                    {std::make_shared<ShellTool>()});
    WireRecorder recorder(runtime.bus());

    auto result = runtime.soul().run_turn("$ echo from-shell");

    REQUIRE(result.outcome == TurnOutcome::Completed);
    REQUIRE(result.final_text == "Tool shell returned:\nfrom-shell\n");
    REQUIRE(result.steps == 2);
    REQUIRE(recorder.count(wire_types::ToolCallResult) == 1);
}

// ── Wire server ─────────────────────────────────────────────────

TEST_CASE("run_wire_server: answers each prompt with a turn", "[runtime][wire]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    provider->push(text_response("one"));
    provider->push(text_response("two"));
    Runtime runtime(quick_config(), provider, dirs.options());

    WireMessage prompt;
    prompt.kind = WireKind::Request;
    prompt.type = wire_types::Prompt;
    prompt.payload = {{"text", "first"}};
    std::string input = encode_wire_message(prompt) + "\n";
    prompt.payload = {{"text", "second"}};
    input += encode_wire_message(prompt) + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    REQUIRE(run_wire_server(runtime, in, out) == 0);

    auto types = line_types(out.str());
    REQUIRE(std::count(types.begin(), types.end(), "TurnBegin") == 2);
    REQUIRE(std::count(types.begin(), types.end(), "TurnEnd") == 2);
    REQUIRE(types.front() == "TurnBegin");
    REQUIRE(types.back() == "TurnEnd");
    REQUIRE(runtime.soul().context().turn_count() == 2);
}

TEST_CASE("run_wire_server: cancel before a prompt still reaches its turn", "[runtime][wire]") {
    RuntimeDirs dirs;
    auto provider = std::make_shared<MockProvider>();
    provider->push(text_response("late"));
    Runtime runtime(quick_config(), provider, dirs.options());

    WireMessage cancel;
    cancel.kind = WireKind::Request;
    cancel.type = wire_types::Cancel;
    WireMessage prompt;
    prompt.kind = WireKind::Request;
    prompt.type = wire_types::Prompt;
    prompt.payload = {{"text", "first"}};
    std::string input = encode_wire_message(cancel) + "\n";
    input += encode_wire_message(prompt) + "\n";
    prompt.payload = {{"text", "second"}};
    input += encode_wire_message(prompt) + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    REQUIRE(run_wire_server(runtime, in, out) == 0);

    std::vector<std::string> outcomes;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        auto msg = decode_wire_message(line);
        if (msg && msg->type == wire_types::TurnEnd) {
            outcomes.push_back(msg->payload.value("outcome", ""));
        }
    }
    REQUIRE(outcomes == std::vector<std::string>{"interrupted", "completed"});
    REQUIRE(provider->chat_call_count == 1);
}

TEST_CASE("run_wire_server: malformed input reports a protocol error", "[runtime][wire]") {
    RuntimeDirs dirs;
    Runtime runtime(quick_config(), std::make_shared<MockProvider>(), dirs.options());

    std::istringstream in("this is not json\n");
    std::ostringstream out;
    REQUIRE(run_wire_server(runtime, in, out) == 0);

    bool found = false;
    std::istringstream lines(out.str());
    std::string line;
    while (std::getline(lines, line)) {
        auto msg = decode_wire_message(line);
        if (msg && msg->type == wire_types::Error &&
            msg->payload.value("code", "") == "protocol_error") {
            found = true;
        }
    }
    REQUIRE(found);
    REQUIRE(runtime.soul().context().turn_count() == 0);
}
