#pragma once

#include "app_core.hpp"
#include "config.hpp"
#include "launch/tmux_launcher.hpp"
#include "platform/linux/event_loop.hpp"
#include "terminal_view.hpp"
#include "transcript_session.hpp"
#include "tui_controller.hpp"

#include <memory>
#include <string>

// The glu-code process: one epoll loop driving the terminal, the recognizer
// pipes and child reaping.
class TuiApp {
public:
    explicit TuiApp(Config config, bool verbose = false);
    ~TuiApp();

    TuiApp(const TuiApp&) = delete;
    TuiApp& operator=(const TuiApp&) = delete;

    bool init();
    void run();

private:
    void on_input();
    std::unique_ptr<OutputMethod> make_output(const std::string& method);
    void log(const std::string& msg);

    Config config_;
    bool verbose_;

    EventLoop loop_;
    TranscriptSession session_;
    TmuxLauncher launcher_;
    AppCore core_;
    TuiController controller_;
    TerminalView view_;
};
