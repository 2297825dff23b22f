#pragma once

#include "recognizer.hpp"

#include <expected>
#include <functional>
#include <string>
#include <string_view>

enum class RecordingState { Idle, Recording, Editing };

std::string_view to_string(RecordingState state);

// Owns the draft and decides which recognizer output still matters.
//
// Idle      no recognizer session, draft frozen
// Recording session live, finals append to the draft, the partial is a preview
// Editing   session stopped, the user edits a copy that is committed on exit
//
// Transcript events are applied only while Recording; anything that arrives
// after a stop (the recognizer may still be flushing) is dropped.
class RecordingStateMachine {
public:
    using RefreshHook = std::function<void()>;

    RecordingStateMachine(Recognizer& recognizer, RecognizerOptions options,
                          RefreshHook refresh = {});

    RecordingStateMachine(const RecordingStateMachine&) = delete;
    RecordingStateMachine& operator=(const RecordingStateMachine&) = delete;

    std::expected<void, std::string> start_recording();
    void stop_recording();

    void enter_editing();
    void update_edit_text(std::string text);
    void exit_editing();

    // Replace the draft wholesale, e.g. with a prompt loaded from history.
    bool replace_draft(std::string text);

    // Returns true if the event changed the draft, the preview or the status.
    bool on_transcript_event(const TranscriptEvent& event);
    void on_abnormal_termination(const std::string& diagnostic);

    RecordingState state() const { return state_; }
    const std::string& draft() const { return draft_; }
    const std::string& partial() const { return partial_; }
    const std::string& edit_text() const { return edit_text_; }
    const std::string& status() const { return status_; }
    const RecognizerOptions& options() const { return options_; }

    // Draft plus the live partial while recording.
    std::string preview() const;

    void set_status(std::string status);
    void set_refresh_hook(RefreshHook refresh) { refresh_ = std::move(refresh); }

private:
    void notify();

    Recognizer& recognizer_;
    RecognizerOptions options_;
    RefreshHook refresh_;

    RecordingState state_ = RecordingState::Idle;
    std::string draft_;
    std::string partial_;
    std::string edit_text_;
    std::string status_;
};
