#include "tui_app.hpp"

#include "output/clipboard_output.hpp"
#include "output/xdotool_output.hpp"

#include <print>
#include <signal.h>
#include <unistd.h>

TuiApp::TuiApp(Config config, bool verbose)
    : config_(std::move(config)), verbose_(verbose),
      session_(loop_, config_.recognizer.program, config_.recognizer.args, verbose),
      launcher_(config_.launcher.multiplexer, config_.launcher.assistant, config_.launcher.extra_args),
      core_(config_, verbose, session_, launcher_,
            [this](const std::string& method) { return make_output(method); }),
      controller_(core_) {}

TuiApp::~TuiApp() {
    session_.shutdown();
    view_.shutdown();
}

bool TuiApp::init() {
    if (!loop_.init({SIGINT, SIGTERM, SIGCHLD, SIGWINCH})) return false;

    loop_.on_signal(SIGCHLD, [this] { session_.reap(); });
    loop_.on_signal(SIGWINCH, [this] { view_.on_resize(); });
    loop_.on_signal(SIGINT, [this] {
        log("Received SIGINT, shutting down");
        loop_.request_stop();
    });
    loop_.on_signal(SIGTERM, [this] {
        log("Received SIGTERM, shutting down");
        loop_.request_stop();
    });

    core_.init();

    if (!view_.init()) return false;
    if (!loop_.watch(STDIN_FILENO, [this] { on_input(); })) {
        std::println(stderr, "tui: cannot watch stdin");
        return false;
    }

    loop_.set_post_dispatch([this] {
        if (controller_.quit_requested()) {
            loop_.request_stop();
            return;
        }
        view_.render(core_, controller_);
    });

    view_.render(core_, controller_);
    log("model: " + config_.model_path());
    return true;
}

void TuiApp::run() {
    loop_.run();

    core_.shutdown();
    session_.shutdown();
    view_.shutdown();
    log("stopped");
}

void TuiApp::on_input() {
    for (const auto& key : view_.read_keys()) {
        controller_.handle_key(key);
        if (controller_.quit_requested()) break;
    }
}

std::unique_ptr<OutputMethod> TuiApp::make_output(const std::string& method) {
    if (method == "clipboard") return std::make_unique<ClipboardOutput>();
    if (method == "xdotool") return std::make_unique<XdotoolOutput>(config_.output.inject_window);
    log("unknown output method: " + method);
    return nullptr;
}

void TuiApp::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[glu-code] {}", msg);
    }
}
