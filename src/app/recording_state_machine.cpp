#include "recording_state_machine.hpp"

#include "text_util.hpp"

std::string_view to_string(RecordingState state) {
    switch (state) {
        case RecordingState::Idle: return "Idle";
        case RecordingState::Recording: return "Recording";
        case RecordingState::Editing: return "Editing";
    }
    return "Unknown";
}

RecordingStateMachine::RecordingStateMachine(Recognizer& recognizer, RecognizerOptions options,
                                             RefreshHook refresh)
    : recognizer_(recognizer), options_(std::move(options)), refresh_(std::move(refresh)) {
    recognizer_.set_event_handler([this](const TranscriptEvent& event) {
        on_transcript_event(event);
    });
    recognizer_.set_fault_handler([this](const std::string& diagnostic) {
        on_abnormal_termination(diagnostic);
    });
}

std::expected<void, std::string> RecordingStateMachine::start_recording() {
    if (state_ == RecordingState::Recording) {
        return std::unexpected("already recording");
    }

    // On failure nothing changes, including an edit in progress.
    auto started = recognizer_.start(options_);
    if (!started) {
        status_ = "Cannot start recording: " + started.error();
        notify();
        return started;
    }

    // Leaving Editing commits the edit, and a new recording starts from an
    // empty draft, so both collapse into clearing here.
    draft_.clear();
    partial_.clear();
    edit_text_.clear();
    status_ = "Recording…";
    state_ = RecordingState::Recording;
    notify();
    return {};
}

void RecordingStateMachine::stop_recording() {
    if (state_ != RecordingState::Recording) return;

    state_ = RecordingState::Idle;
    partial_.clear();
    recognizer_.stop();
    status_ = "Recording stopped.";
    notify();
}

void RecordingStateMachine::enter_editing() {
    if (state_ == RecordingState::Editing) return;

    if (state_ == RecordingState::Recording) {
        state_ = RecordingState::Idle;
        recognizer_.stop();
    }

    partial_.clear();
    edit_text_ = draft_;
    status_.clear();
    state_ = RecordingState::Editing;
    notify();
}

void RecordingStateMachine::update_edit_text(std::string text) {
    if (state_ != RecordingState::Editing) return;
    edit_text_ = std::move(text);
    notify();
}

void RecordingStateMachine::exit_editing() {
    if (state_ != RecordingState::Editing) return;

    draft_ = std::move(edit_text_);
    edit_text_.clear();
    state_ = RecordingState::Idle;
    notify();
}

bool RecordingStateMachine::replace_draft(std::string text) {
    if (state_ == RecordingState::Editing) return false;

    if (state_ == RecordingState::Recording) {
        state_ = RecordingState::Idle;
        partial_.clear();
        recognizer_.stop();
    }

    draft_ = std::move(text);
    notify();
    return true;
}

bool RecordingStateMachine::on_transcript_event(const TranscriptEvent& event) {
    if (state_ != RecordingState::Recording) return false;

    switch (event.type) {
        case TranscriptEventType::Partial:
            partial_ = text::trim(event.text);
            break;
        case TranscriptEventType::Final:
            partial_.clear();
            draft_ = text::join_trimmed(draft_, event.text);
            break;
        case TranscriptEventType::Error:
            partial_.clear();
            status_ = "STT error: " + event.text;
            break;
    }

    notify();
    return true;
}

void RecordingStateMachine::on_abnormal_termination(const std::string& diagnostic) {
    if (state_ != RecordingState::Recording) return;

    state_ = RecordingState::Idle;
    partial_.clear();
    status_ = "Recording stopped (" + diagnostic + ").";
    notify();
}

std::string RecordingStateMachine::preview() const {
    auto base = text::trim(draft_);
    if (state_ != RecordingState::Recording || partial_.empty()) return base;
    return text::join_trimmed(base, partial_) + " …";
}

void RecordingStateMachine::set_status(std::string status) {
    status_ = std::move(status);
    notify();
}

void RecordingStateMachine::notify() {
    if (refresh_) refresh_();
}
