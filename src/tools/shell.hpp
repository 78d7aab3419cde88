#pragma once
#include "../tool.hpp"
#include <string>
#include <sys/types.h>

namespace soulwire {

// Runs one command through /bin/sh in the working directory. The child
// gets its own process group so an interrupt or timeout kills the whole
// pipeline.
class ShellTool : public Tool {
public:
    ToolResult execute(const std::string& args_json, const ToolContext& ctx) override;
    std::string tool_name() const override { return "shell"; }
    std::string description() const override;
    std::string parameters_json() const override;

private:
    static constexpr int kPollSliceMs = 50;
    static constexpr int kDefaultTimeoutSec = 60;
    static constexpr size_t kMaxOutput = 10000;

    enum class Ending { Exited, Interrupted, TimedOut };

    struct RunResult {
        std::string output;
        Ending ending = Ending::Exited;
        int status = 0;
    };

    static RunResult collect(int stdout_fd, pid_t pid, int timeout_sec,
                             const InterruptToken& interrupt);
};

} // namespace soulwire
