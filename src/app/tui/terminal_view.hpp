#pragma once

#include "app_core.hpp"
#include "key.hpp"
#include "tui_controller.hpp"

#include <string_view>
#include <vector>

// ncurses screen: prompt box and status lines on the left, history on the
// right. Input is read without blocking; the owner polls stdin.
class TerminalView {
public:
    TerminalView() = default;
    ~TerminalView();

    TerminalView(const TerminalView&) = delete;
    TerminalView& operator=(const TerminalView&) = delete;

    bool init();
    void shutdown();

    // Every key currently buffered on stdin.
    std::vector<Key> read_keys();

    void render(const AppCore& core, const TuiController& controller);

    // Picks up the new terminal size after SIGWINCH.
    void on_resize();

    static constexpr int HISTORY_WIDTH = 36;

private:
    void draw_box(int y, int x, int h, int w, std::string_view title);
    void put_text(int y, int x, std::string_view s, int width);
    void draw_prompt(const AppCore& core, const TuiController& controller,
                     int y, int x, int h, int w);
    void draw_history(const AppCore& core, const TuiController& controller,
                      int y, int x, int h, int w);

    bool active_ = false;
    int cursor_y_ = -1;
    int cursor_x_ = -1;
};
