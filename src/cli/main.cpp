#include "app_core.hpp"
#include "config.hpp"
#include "launch/tmux_launcher.hpp"
#include "output/xdotool_output.hpp"
#include "platform/linux/event_loop.hpp"
#include "storage/prompt_db.hpp"
#include "text_util.hpp"
#include "transcript_session.hpp"

#include <cstdio>
#include <print>
#include <signal.h>
#include <string>

static void usage(const char* prog) {
    std::println(stderr, "Usage: {} <command> [options]", prog);
    std::println(stderr, "Commands:");
    std::println(stderr, "  last [--workdir DIR]              Launch the assistant on the last saved prompt");
    std::println(stderr, "  inject [--window ID] [--model DIR] Dictate straight into an X11 window");
    std::println(stderr, "  history [--limit N]               Show saved prompts");
    std::println(stderr, "Options:");
    std::println(stderr, "  -c, --config PATH                 Config file path");
    std::println(stderr, "  -v, --verbose                     Enable verbose logging");
}

static int cmd_last(const Config& config, const std::string& workdir) {
    PromptDb db;
    if (!db.open(config.db_path())) return 1;

    auto prompt = db.last_prompt();
    if (!prompt) {
        std::println(stderr, "No prompts have been saved yet.");
        return 1;
    }

    TmuxLauncher launcher(config.launcher.multiplexer, config.launcher.assistant,
                          config.launcher.extra_args);
    auto launched = launcher.launch(LaunchRequest{
        .prompt = prompt->text,
        .workdir = workdir,
        .prompt_id = prompt->id,
    });
    if (!launched) {
        std::println(stderr, "Failed to launch {}: {}", launcher.assistant(), launched.error());
        return 1;
    }

    if (auto run = db.log_run(prompt->id, launched->command, launched->window_name); !run) {
        std::println(stderr, "Warning: run not recorded: {}", run.error());
    }
    std::println("Launched prompt #{} in {} window \"{}\"", prompt->id,
                 config.launcher.multiplexer, launched->window_name);
    return 0;
}

static int cmd_history(const Config& config, int limit) {
    PromptDb db;
    if (!db.open(config.db_path())) return 1;

    auto prompts = db.list_prompts(limit);
    if (prompts.empty()) {
        std::println("No history.");
        return 0;
    }

    for (auto& p : prompts) {
        std::println("#{}  {}  {}", p.id, PromptDb::local_time(p.created_at, true),
                     text::squash_whitespace(text::utf8_prefix(p.text, 60)));
        if (auto run = db.last_run_for_prompt(p.id)) {
            std::println("      last run {}", AppCore::format_run(*run));
        }
    }
    return 0;
}

static int cmd_inject(const Config& config, bool verbose) {
    if (config.output.inject_window.empty()) {
        std::println(stderr, "Set XDO_WINDOW_ID to the target window id (xdotool search ...).");
        return 1;
    }

    EventLoop loop;
    if (!loop.init({SIGINT, SIGTERM, SIGCHLD})) return 1;

    TranscriptSession session(loop, config.recognizer.program, config.recognizer.args, verbose);
    XdotoolOutput output(config.output.inject_window);

    session.set_event_handler([&](const TranscriptEvent& event) {
        switch (event.type) {
            case TranscriptEventType::Partial:
                std::print("\rpartial: {}", event.text);
                std::fflush(stdout);
                break;
            case TranscriptEventType::Final: {
                std::print("\nfinal: {}\n", event.text);
                std::fflush(stdout);
                auto msg = text::squash_whitespace(event.text);
                if (msg.empty()) break;
                if (auto res = output.deliver(msg); !res) {
                    std::println(stderr, "{}", res.error());
                }
                break;
            }
            case TranscriptEventType::Error:
                std::println(stderr, "stt error: {}", event.text);
                break;
        }
    });
    session.set_fault_handler([&](const std::string& diagnostic) {
        std::println(stderr, "Recording stopped ({}).", diagnostic);
        loop.request_stop();
    });

    loop.on_signal(SIGCHLD, [&] { session.reap(); });

    auto started = session.start(RecognizerOptions{
        .model_path = config.model_path(),
        .sample_rate = config.recognizer.sample_rate,
        .device = config.recognizer.device,
    });
    if (!started) {
        std::println(stderr, "Cannot start recording: {}", started.error());
        return 1;
    }

    std::println("Starting headless recorder -> xdotool (target window {})",
                 config.output.inject_window);
    loop.run();

    session.shutdown();
    std::println("");
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    std::string config_path;
    std::string workdir;
    std::string window;
    std::string model_path;
    bool verbose = false;
    int limit = 20;

    for (int i = 2; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--workdir" && i + 1 < argc) {
            workdir = argv[++i];
        } else if (arg == "--window" && i + 1 < argc) {
            window = argv[++i];
        } else if ((arg == "--model" || arg == "-m") && i + 1 < argc) {
            model_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            auto parsed = text::parse_positive_int(argv[++i]);
            if (!parsed) {
                std::println(stderr, "Invalid --limit: {}", argv[i]);
                usage(argv[0]);
                return 1;
            }
            limit = *parsed;
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            usage(argv[0]);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_environment();
    if (!window.empty()) config.output.inject_window = window;
    if (!model_path.empty()) config.recognizer.model_path = model_path;

    ::signal(SIGPIPE, SIG_IGN);

    if (command == "last") return cmd_last(config, workdir);
    if (command == "history") return cmd_history(config, limit);
    if (command == "inject") return cmd_inject(config, verbose);

    std::println(stderr, "Unknown command: {}", command);
    usage(argv[0]);
    return 1;
}
