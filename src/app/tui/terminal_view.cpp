#include "terminal_view.hpp"

#include "text_layout.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <climits>
#include <clocale>
#include <cwchar>
#include <curses.h>
#include <print>
#include <string>
#include <sys/ioctl.h>
#include <unistd.h>

namespace {

constexpr const char* TITLE = "GLU CODE: Linux Voice -> Code";

Key translate_function_key(wint_t ch) {
    switch (ch) {
        case KEY_ENTER: return Key::special(KeyCode::Enter);
        case KEY_BACKSPACE: return Key::special(KeyCode::Backspace);
        case KEY_DC: return Key::special(KeyCode::Delete);
        case KEY_LEFT: return Key::special(KeyCode::Left);
        case KEY_RIGHT: return Key::special(KeyCode::Right);
        case KEY_UP: return Key::special(KeyCode::Up);
        case KEY_DOWN: return Key::special(KeyCode::Down);
        case KEY_HOME: return Key::special(KeyCode::Home);
        case KEY_END: return Key::special(KeyCode::End);
        default: return Key::special(KeyCode::Unknown);
    }
}

Key translate_char(wint_t ch) {
    switch (ch) {
        case '\n':
        case '\r': return Key::special(KeyCode::Enter);
        case 27: return Key::special(KeyCode::Escape);
        case 8:
        case 127: return Key::special(KeyCode::Backspace);
        case '\t': return Key::character("\t");
        default: break;
    }
    if (ch >= 1 && ch <= 26) return Key::control(static_cast<char>('a' + ch - 1));
    if (ch < 32) return Key::special(KeyCode::Unknown);

    char buf[MB_LEN_MAX];
    std::mbstate_t state{};
    size_t n = std::wcrtomb(buf, static_cast<wchar_t>(ch), &state);
    if (n == static_cast<size_t>(-1)) return Key::special(KeyCode::Unknown);
    return Key::character(std::string(buf, n));
}

} // namespace

TerminalView::~TerminalView() {
    shutdown();
}

bool TerminalView::init() {
    std::setlocale(LC_ALL, "");

    if (!::isatty(STDIN_FILENO)) {
        std::println(stderr, "tui: stdin is not a terminal");
        return false;
    }
    if (!initscr()) {
        std::println(stderr, "tui: initscr failed");
        return false;
    }
    active_ = true;

    raw();
    noecho();
    nonl();
    keypad(stdscr, TRUE);
    nodelay(stdscr, TRUE);
    set_escdelay(25);
    curs_set(0);
    return true;
}

void TerminalView::shutdown() {
    if (!active_) return;
    endwin();
    active_ = false;
}

std::vector<Key> TerminalView::read_keys() {
    std::vector<Key> keys;
    if (!active_) return keys;

    wint_t ch;
    while (true) {
        int rc = get_wch(&ch);
        if (rc == ERR) break;
        if (rc == KEY_CODE_YES) {
            if (ch == KEY_RESIZE) continue;
            keys.push_back(translate_function_key(ch));
        } else {
            keys.push_back(translate_char(ch));
        }
    }
    return keys;
}

void TerminalView::on_resize() {
    if (!active_) return;

    winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
        resizeterm(ws.ws_row, ws.ws_col);
    }
    clear();
}

void TerminalView::render(const AppCore& core, const TuiController& controller) {
    if (!active_) return;

    int height = 0;
    int width = 0;
    getmaxyx(stdscr, height, width);
    erase();
    cursor_y_ = cursor_x_ = -1;

    if (height < 8 || width < 20) {
        put_text(0, 0, "Terminal too small", width);
        curs_set(0);
        refresh();
        return;
    }

    bool show_history = controller.history_open() && width >= HISTORY_WIDTH + 30;
    int main_w = show_history ? width - HISTORY_WIDTH - 1 : width;

    attron(A_BOLD);
    put_text(0, 1, TITLE, main_w - 1);
    attroff(A_BOLD);

    draw_prompt(core, controller, 1, 0, height - 4, main_w);

    put_text(height - 3, 1, core.mode_line(), main_w - 1);
    put_text(height - 2, 1, core.status(), main_w - 1);
    attron(A_DIM);
    put_text(height - 1, 1, TuiController::HINTS, main_w - 1);
    attroff(A_DIM);

    if (show_history) {
        draw_history(core, controller, 0, width - HISTORY_WIDTH, height, HISTORY_WIDTH);
    }

    if (cursor_y_ >= 0) {
        curs_set(1);
        move(cursor_y_, cursor_x_);
    } else {
        curs_set(0);
    }
    refresh();
}

void TerminalView::draw_prompt(const AppCore& core, const TuiController& controller,
                               int y, int x, int h, int w) {
    draw_box(y, x, h, w, core.prompt_title());

    int inner_h = h - 2;
    int inner_w = w - 4;
    if (inner_h < 1 || inner_w < 1) return;

    bool editing = core.state() == RecordingState::Editing;
    const auto& buffer = controller.edit_buffer();
    std::string content = editing ? buffer.text() : core.preview();

    auto lines = wrap_text(content, inner_w);

    // Keep the cursor in view while editing; otherwise show the newest text.
    int first = 0;
    CursorPos cursor{};
    if (editing) {
        cursor = cursor_position(content, lines, buffer.cursor());
        if (cursor.col >= inner_w) {
            cursor.col = 0;
            ++cursor.row;
        }
        first = std::max(0, cursor.row - inner_h + 1);
    } else {
        first = std::max(0, static_cast<int>(lines.size()) - inner_h);
    }

    for (int row = 0; row < inner_h; ++row) {
        size_t idx = static_cast<size_t>(first + row);
        if (idx >= lines.size()) break;
        auto line = std::string_view(content).substr(lines[idx].begin, lines[idx].end - lines[idx].begin);
        put_text(y + 1 + row, x + 2, line, inner_w);
    }

    if (editing) {
        cursor_y_ = y + 1 + cursor.row - first;
        cursor_x_ = x + 2 + cursor.col;
    }
}

void TerminalView::draw_history(const AppCore& core, const TuiController& controller,
                                int y, int x, int h, int w) {
    draw_box(y, x, h, w, "History (H)");

    int inner_w = w - 2;
    int list_h = h - 3; // last inner row holds the multiplexer status
    const auto& items = core.history();

    if (items.empty()) {
        put_text(y + 1, x + 1, "(no saved prompts)", inner_w);
    }

    // Two rows per item: label, then the description.
    int per_page = std::max(1, list_h / 2);
    int selected = static_cast<int>(controller.history_selected());
    int first = std::max(0, selected - per_page + 1);

    for (int i = 0; i < per_page; ++i) {
        size_t idx = static_cast<size_t>(first + i);
        if (idx >= items.size()) break;
        const auto& item = items[idx];
        bool is_selected = static_cast<int>(idx) == selected;
        int row = y + 1 + i * 2;

        if (is_selected) attron(A_REVERSE);
        put_text(row, x + 1, item.label, inner_w);
        if (is_selected) attroff(A_REVERSE);
        attron(A_DIM);
        put_text(row + 1, x + 2, item.description, inner_w - 1);
        attroff(A_DIM);
    }

    put_text(y + h - 2, x + 1, core.multiplexer_status(), inner_w);
}

void TerminalView::draw_box(int y, int x, int h, int w, std::string_view title) {
    if (h < 2 || w < 2) return;

    mvhline(y, x + 1, ACS_HLINE, w - 2);
    mvhline(y + h - 1, x + 1, ACS_HLINE, w - 2);
    mvvline(y + 1, x, ACS_VLINE, h - 2);
    mvvline(y + 1, x + w - 1, ACS_VLINE, h - 2);
    mvaddch(y, x, ACS_ULCORNER);
    mvaddch(y, x + w - 1, ACS_URCORNER);
    mvaddch(y + h - 1, x, ACS_LLCORNER);
    mvaddch(y + h - 1, x + w - 1, ACS_LRCORNER);

    if (!title.empty() && w > 6) {
        attron(A_BOLD);
        put_text(y, x + 2, " " + std::string(title) + " ", w - 4);
        attroff(A_BOLD);
    }
}

// Writes at most `width` code points; multibyte output needs the wide library.
void TerminalView::put_text(int y, int x, std::string_view s, int width) {
    if (width <= 0) return;
    auto clipped = text::utf8_prefix(s, static_cast<size_t>(width));
    mvaddstr(y, x, clipped.c_str());
}
