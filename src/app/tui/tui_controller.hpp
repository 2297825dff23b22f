#pragma once

#include "app_core.hpp"
#include "edit_buffer.hpp"
#include "key.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

// Maps keys onto AppCore operations and holds the view-only state: the edit
// buffer with its cursor, and the history panel selection.
class TuiController {
public:
    explicit TuiController(AppCore& core);

    void handle_key(const Key& key);

    bool quit_requested() const { return quit_; }
    bool history_open() const { return history_open_; }
    size_t history_selected() const { return history_selected_; }
    const EditBuffer& edit_buffer() const { return edit_; }

    static constexpr const char* HINTS =
        "R record · Ctrl+E edit · Ctrl+S save · Ctrl+Q exit edit · S save · H history · "
        "C launch · Y copy · I inject · Q quit";

private:
    void handle_editing_key(const Key& key);
    bool handle_history_key(const Key& key);
    void toggle_history();
    void sync_selection();

    AppCore& core_;
    EditBuffer edit_;
    bool quit_ = false;
    bool history_open_ = true;
    size_t history_selected_ = 0;
    std::optional<int64_t> seen_prompt_id_;
};
