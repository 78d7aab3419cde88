#include "commands.hpp"
#include "runtime.hpp"
#include "util.hpp"

namespace soulwire {

std::string cmd_status(Runtime& runtime) {
    Soul& soul = runtime.soul();
    const auto& ctx = soul.context();
    return "Provider: " + soul.provider().provider_name() + "\n"
        + "Model: " + soul.options().model + "\n"
        + "Session: " + runtime.session().id + "\n"
        + "Work dir: " + runtime.session().work_dir + "\n"
        + "Context: " + std::to_string(ctx.size()) + " messages, ~"
        + std::to_string(ctx.estimate_tokens()) + " tokens (compacts above "
        + std::to_string(soul.options().compaction_threshold()) + ")\n"
        + "Compactions: " + std::to_string(ctx.compaction_count()) + "\n"
        + "YOLO: " + (runtime.approval().yolo() ? "on" : "off") + "\n";
}

std::string cmd_compact(Soul& soul) {
    size_t before = soul.context().size();
    if (!soul.compact_now()) {
        return "Nothing to compact.";
    }
    return "Compacted " + std::to_string(before) + " messages into " +
           std::to_string(soul.context().size()) + ".";
}

std::string cmd_clear(Soul& soul) {
    soul.clear();
    return "Context cleared.";
}

std::string cmd_yolo(Approval& approval) {
    bool on = !approval.yolo();
    approval.set_yolo(on);
    return on ? "YOLO mode on: tool calls run without asking."
              : "YOLO mode off: tool calls ask for approval again.";
}

std::string cmd_help() {
    return "Commands:\n"
           "  /status   Show session, model and context info\n"
           "  /compact  Summarize older messages now\n"
           "  /clear    Start over with an empty context\n"
           "  /yolo     Toggle automatic approval of tool calls\n"
           "  /help     Show this help\n"
           "  /quit     Exit\n";
}

std::optional<CommandResult> handle_command(const std::string& line, Runtime& runtime) {
    std::string cmd = trim(line);
    if (cmd.empty() || cmd[0] != '/') return std::nullopt;

    if (cmd == "/quit" || cmd == "/exit") return CommandResult{"", true};
    if (cmd == "/status") return CommandResult{cmd_status(runtime)};
    if (cmd == "/compact") return CommandResult{cmd_compact(runtime.soul())};
    if (cmd == "/clear") return CommandResult{cmd_clear(runtime.soul())};
    if (cmd == "/yolo") return CommandResult{cmd_yolo(runtime.approval())};
    if (cmd == "/help") return CommandResult{cmd_help()};
    return CommandResult{"Unknown command: " + cmd + " (try /help)"};
}

} // namespace soulwire
