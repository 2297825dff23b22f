#include "tui_controller.hpp"

TuiController::TuiController(AppCore& core)
    : core_(core) {}

void TuiController::handle_key(const Key& key) {
    if (key.is_ctrl('c')) {
        quit_ = true;
        return;
    }

    if (core_.state() == RecordingState::Editing) {
        handle_editing_key(key);
        sync_selection();
        return;
    }

    if (history_open_ && handle_history_key(key)) return;

    if (key.is_ctrl('e')) {
        core_.enter_editing();
        edit_.set_text(core_.edit_text());
    } else if (key.code == KeyCode::Char && key.text.size() == 1) {
        switch (key.text[0]) {
            case 'r': core_.toggle_recording(); break;
            case 's': core_.save_prompt(); break;
            case 'c': core_.launch_assistant(); break;
            case 'y': core_.copy_prompt(); break;
            case 'i': core_.inject_prompt(); break;
            case 'h': toggle_history(); break;
            case 'q': quit_ = true; break;
            default: break;
        }
    }
    sync_selection();
}

void TuiController::handle_editing_key(const Key& key) {
    if (key.code == KeyCode::Escape || key.is_ctrl('q')) {
        core_.exit_editing();
        return;
    }
    if (key.is_ctrl('s')) {
        core_.save_and_exit_editing();
        return;
    }

    bool changed = false;
    switch (key.code) {
        case KeyCode::Char: edit_.insert(key.text); changed = true; break;
        case KeyCode::Enter: edit_.insert("\n"); changed = true; break;
        case KeyCode::Backspace: changed = edit_.backspace(); break;
        case KeyCode::Delete: changed = edit_.erase_forward(); break;
        case KeyCode::Left: edit_.move_left(); break;
        case KeyCode::Right: edit_.move_right(); break;
        case KeyCode::Up: edit_.move_up(); break;
        case KeyCode::Down: edit_.move_down(); break;
        case KeyCode::Home: edit_.move_home(); break;
        case KeyCode::End: edit_.move_end(); break;
        default: break;
    }
    if (changed) core_.update_edit_text(edit_.text());
}

bool TuiController::handle_history_key(const Key& key) {
    const auto& items = core_.history();
    switch (key.code) {
        case KeyCode::Up:
            if (history_selected_ > 0) --history_selected_;
            return true;
        case KeyCode::Down:
            if (history_selected_ + 1 < items.size()) ++history_selected_;
            return true;
        case KeyCode::Enter:
            if (history_selected_ < items.size()) {
                core_.select_prompt(items[history_selected_].prompt.id);
            }
            return true;
        default:
            return false;
    }
}

void TuiController::toggle_history() {
    history_open_ = !history_open_;
    if (history_open_) core_.refresh_history();
}

// Follows the active prompt into the list after saves and loads.
void TuiController::sync_selection() {
    const auto& items = core_.history();
    if (history_selected_ >= items.size()) {
        history_selected_ = items.empty() ? 0 : items.size() - 1;
    }

    auto active = core_.active_prompt_id();
    if (active == seen_prompt_id_) return;
    seen_prompt_id_ = active;
    if (!active) return;

    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].prompt.id == *active) {
            history_selected_ = i;
            break;
        }
    }
}
