#include "config.hpp"
#include "platform/platform_paths.hpp"
#include "tui/tui_app.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <print>
#include <signal.h>

namespace fs = std::filesystem;

// The screen belongs to curses; diagnostics go to a file instead.
static bool redirect_stderr(const std::string& path) {
    std::error_code ec;
    auto parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    if (!std::freopen(path.c_str(), "a", stderr)) {
        std::println("cannot open log file {}: {}", path, std::strerror(errno));
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    std::string model_path;
    std::string log_path;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--model" || arg == "-m") {
            if (i + 1 < argc) model_path = argv[++i];
        } else if (arg == "--log" || arg == "-l") {
            if (i + 1 < argc) log_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: glu-code [options]");
            std::println("Options:");
            std::println("  -m, --model DIR     Speech model directory");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -l, --log FILE      Diagnostics log (default: <data dir>/glu-code.log)");
            std::println("  -v, --verbose       Enable verbose logging");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {} (see --help)", arg);
            return 2;
        }
    }

    if (log_path.empty()) {
        auto data = platform::data_dir();
        log_path = (data.empty() ? std::string("/tmp/glu-code") : data) + "/glu-code.log";
    }
    if (!redirect_stderr(log_path)) return 1;

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    config.apply_environment();
    if (!model_path.empty()) config.recognizer.model_path = model_path;

    // Clipboard and launcher helpers are fed through pipes.
    ::signal(SIGPIPE, SIG_IGN);

    if (verbose) {
        std::println(stderr, "[glu-code] Starting (recognizer: {}, model: {})",
                     config.recognizer.program, config.model_path());
    }

    TuiApp app(std::move(config), verbose);
    if (!app.init()) {
        std::println(stderr, "Failed to initialize terminal UI");
        std::println("glu-code: failed to start, see {}", log_path);
        return 1;
    }

    app.run();
    return 0;
}
