#include "shell.hpp"
#include "tool_util.hpp"
#include "../plugin.hpp"
#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

static soulwire::ToolRegistrar reg_shell("shell",
    []() { return std::make_shared<soulwire::ShellTool>(); });

namespace soulwire {

ToolResult ShellTool::execute(const std::string& args_json, const ToolContext& ctx) {
    nlohmann::json args;
    if (auto err = parse_tool_json(args_json, args)) return *err;
    if (auto err = require_string(args, "command")) return *err;

    std::string cmd = args["command"].get<std::string>() + " 2>&1";
    int timeout_sec = args.value("timeout", kDefaultTimeoutSec);
    if (timeout_sec <= 0) timeout_sec = kDefaultTimeoutSec;

    int stdout_pipe[2];
    if (pipe(stdout_pipe) != 0) {
        return ToolResult{false, "Failed to create pipe"};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return ToolResult{false, "Failed to fork process"};
    }

    if (pid == 0) {
        // Child process: own process group, no stdin
        setpgid(0, 0);
        close(stdout_pipe[0]);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stdout_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        if (!ctx.work_dir.empty() && chdir(ctx.work_dir.c_str()) != 0) {
            _exit(126);
        }
        execl("/bin/sh", "sh", "-c", cmd.c_str(), nullptr);
        _exit(127);
    }

    close(stdout_pipe[1]);
    auto result = collect(stdout_pipe[0], pid, timeout_sec, ctx.interrupt);
    close(stdout_pipe[0]);

    if (result.output.size() > kMaxOutput) {
        result.output = result.output.substr(0, kMaxOutput) + "\n[truncated]";
    }

    switch (result.ending) {
        case Ending::Interrupted:
            return ToolResult{false, result.output + "\n[interrupted]"};
        case Ending::TimedOut:
            return ToolResult{false, result.output + "\n[timed out after " +
                                     std::to_string(timeout_sec) + "s]"};
        case Ending::Exited:
            break;
    }
    bool success = WIFEXITED(result.status) && WEXITSTATUS(result.status) == 0;
    if (!success && WIFEXITED(result.status)) {
        result.output += "\n[exit code " + std::to_string(WEXITSTATUS(result.status)) + "]";
    }
    return ToolResult{success, result.output};
}

ShellTool::RunResult ShellTool::collect(int stdout_fd, pid_t pid, int timeout_sec,
                                        const InterruptToken& interrupt) {
    RunResult result;
    std::array<char, 4096> buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_sec);
    bool eof = false;

    while (!eof) {
        if (interrupt.is_set()) {
            result.ending = Ending::Interrupted;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.ending = Ending::TimedOut;
            break;
        }

        struct pollfd pfd;
        pfd.fd = stdout_fd;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, kPollSliceMs);
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        if ((pfd.revents & POLLIN) != 0) {
            ssize_t n = read(stdout_fd, buffer.data(), buffer.size());
            if (n > 0) {
                result.output.append(buffer.data(), static_cast<size_t>(n));
                continue;
            }
            eof = true;
        } else if ((pfd.revents & (POLLHUP | POLLERR)) != 0) {
            eof = true;
        }
    }

    if (result.ending != Ending::Exited) {
        kill(-pid, SIGKILL);
    }
    waitpid(pid, &result.status, 0);
    return result;
}

std::string ShellTool::description() const {
    return "Execute a shell command in the working directory and return its combined "
           "stdout and stderr. Commands get no stdin and are killed after the timeout.";
}

std::string ShellTool::parameters_json() const {
    return R"json({"type":"object","properties":{"command":{"type":"string","description":"The shell command to execute"},"timeout":{"type":"integer","description":"Seconds before the command is killed (default 60)"}},"required":["command"]})json";
}

} // namespace soulwire
