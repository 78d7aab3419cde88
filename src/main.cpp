#include "commands.hpp"
#include "config.hpp"
#include "console.hpp"
#include "context.hpp"
#include "errors.hpp"
#include "plugin.hpp"
#include "runtime.hpp"
#include "util.hpp"
#include "wire_channel.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>

static std::atomic<bool> g_interrupt{false};
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int sig) {
    if (sig == SIGINT) g_interrupt.store(true);
    else g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: soulwire [options]\n"
              << "\n"
              << "Options:\n"
              << "  -m, --message MSG    Run a single turn and exit\n"
              << "  --work-dir DIR       Working directory of the session (default: .)\n"
              << "  -c, --continue       Resume the last session of the working directory\n"
              << "  --yolo               Run tool calls without asking for approval\n"
              << "  --wire               Speak the wire protocol on stdin/stdout\n"
              << "  --replay PATH        Rebuild a context from a wire log and print it\n"
              << "  --provider NAME      Use specific provider\n"
              << "  --model NAME         Use specific model\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Interactive commands:\n"
              << "  /status /compact /clear /yolo /help /quit\n"
              << "\n"
              << "Environment variables:\n"
              << "  SOULWIRE_PROVIDER    Provider name (default from config.json)\n"
              << "  SOULWIRE_MODEL       Model name\n"
              << "  SOULWIRE_YOLO        1 or true to skip approvals\n"
              << "  SOULWIRE_SHARE_DIR   Config and session directory (default: ~/.soulwire)\n";
}

static int run_replay(const std::string& path) {
    auto ctx = soulwire::Context::replay_from_log(path);
    for (const auto& msg : ctx.messages()) {
        std::cout << "[" << soulwire::role_to_string(msg.role)
                  << (msg.summary ? ", summary" : "") << "]\n";
        for (const auto& part : msg.parts) {
            switch (part.type) {
                case soulwire::PartType::Text:
                    std::cout << part.text << "\n";
                    break;
                case soulwire::PartType::Think:
                    std::cout << "(thinking) " << part.text << "\n";
                    break;
                case soulwire::PartType::ToolCall:
                    std::cout << "-> " << part.call.name << " " << part.call.arguments << "\n";
                    break;
                case soulwire::PartType::ToolResult:
                    std::cout << "<- " << part.call.name << (part.is_error ? " (error)" : "")
                              << ": " << part.text << "\n";
                    break;
            }
        }
        std::cout << "\n";
    }
    std::cout << ctx.size() << " messages, " << ctx.turn_count() << " turns, "
              << ctx.compaction_count() << " compactions, ~"
              << ctx.estimate_tokens() << " tokens\n";
    return 0;
}

int main(int argc, char* argv[]) try {
    std::string message;
    std::string provider_name;
    std::string model_name;
    std::string replay_path;
    soulwire::RuntimeOptions options;
    options.work_dir = std::filesystem::current_path().string();
    bool wire_mode = false;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if ((std::strcmp(argv[i], "-m") == 0 || std::strcmp(argv[i], "--message") == 0) && i + 1 < argc) {
            message = argv[++i];
        } else if (std::strcmp(argv[i], "--work-dir") == 0 && i + 1 < argc) {
            options.work_dir = argv[++i];
        } else if (std::strcmp(argv[i], "-c") == 0 || std::strcmp(argv[i], "--continue") == 0) {
            options.continue_last = true;
        } else if (std::strcmp(argv[i], "--yolo") == 0) {
            options.yolo = true;
        } else if (std::strcmp(argv[i], "--wire") == 0) {
            wire_mode = true;
        } else if (std::strcmp(argv[i], "--replay") == 0 && i + 1 < argc) {
            replay_path = argv[++i];
        } else if (std::strcmp(argv[i], "--provider") == 0 && i + 1 < argc) {
            provider_name = argv[++i];
        } else if (std::strcmp(argv[i], "--model") == 0 && i + 1 < argc) {
            model_name = argv[++i];
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        }
    }

    if (!replay_path.empty()) {
        return run_replay(replay_path);
    }

    auto config = soulwire::Config::load();

    // Override config with CLI args
    if (!provider_name.empty()) config.provider = provider_name;
    if (!model_name.empty()) config.model = model_name;

    std::shared_ptr<soulwire::Provider> provider;
    try {
        provider = soulwire::PluginRegistry::instance().create_provider(config.provider, config);
    } catch (const std::exception& e) {
        std::cerr << "Error creating provider: " << e.what() << "\n";
        return 1;
    }

    soulwire::Runtime runtime(config, provider, options);

    if (wire_mode) {
        return soulwire::run_wire_server(runtime, std::cin, std::cout);
    }

    soulwire::Console console(runtime.bus(), runtime.approval().broker(), std::cin, std::cout);

    // Ctrl+C interrupts the running turn instead of killing the process
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::thread watcher([&runtime]() {
        while (!g_shutdown.load()) {
            if (g_interrupt.exchange(false)) {
                runtime.soul().interrupt();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    });
    struct WatcherStop {
        std::thread& t;
        ~WatcherStop() {
            g_shutdown.store(true);
            t.join();
        }
    } stop_watcher{watcher};

    // Single message mode
    if (!message.empty()) {
        auto result = runtime.soul().run_turn(message);
        return result.outcome == soulwire::TurnOutcome::Completed ? 0 : 1;
    }

    // Interactive REPL
    std::cout << "Soulwire\n"
              << "Provider: " << provider->provider_name()
              << " | Model: " << config.model
              << " | Session: " << runtime.session().id
              << (runtime.resumed() ? " (resumed)" : "") << "\n"
              << "Type /help for commands, /quit to exit.\n\n";

    std::string line;
    while (!g_shutdown.load()) {
        std::cout << "soulwire> " << std::flush;

        if (!std::getline(std::cin, line)) {
            // EOF (Ctrl+D)
            std::cout << "\n";
            break;
        }
        if (soulwire::trim(line).empty()) continue;

        if (auto cmd = soulwire::handle_command(line, runtime)) {
            if (cmd->quit) break;
            std::cout << cmd->output << "\n";
            continue;
        }

        // A Ctrl+C at the prompt must not cancel the turn about to start
        g_interrupt.store(false);
        runtime.soul().clear_interrupt();
        runtime.soul().run_turn(line);
        std::cout << "\n";
    }

    return 0;
} catch (const soulwire::SessionBusyError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 2;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
