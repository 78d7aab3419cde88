#pragma once
#include <optional>
#include <string>

namespace soulwire {

class Runtime;
class Soul;
class Approval;

// Slash command handlers used by the REPL. Each returns the text to show.

std::string cmd_status(Runtime& runtime);
std::string cmd_compact(Soul& soul);
std::string cmd_clear(Soul& soul);
std::string cmd_yolo(Approval& approval);
std::string cmd_help();

struct CommandResult {
    std::string output;
    bool quit = false;
};

// Run `line` if it is a slash command; nullopt when it is ordinary input.
std::optional<CommandResult> handle_command(const std::string& line, Runtime& runtime);

} // namespace soulwire
