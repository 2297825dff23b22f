#pragma once

#include "config.hpp"
#include "launch/launcher.hpp"
#include "output/output.hpp"
#include "recognizer.hpp"
#include "recording_state_machine.hpp"
#include "storage/prompt_db.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct HistoryItem {
    PromptRecord prompt;
    std::optional<RunRecord> last_run;
    std::string label;       // "#12"
    std::string description; // squashed text prefix, plus the last run time
};

// Everything the terminal UI does, minus the terminal. Owns the draft (through
// the state machine), the active prompt and the prompt store; every operation
// reports its outcome through status().
class AppCore {
public:
    // "clipboard" or "xdotool"; may return nullptr for an unknown method.
    using OutputFactory = std::function<std::unique_ptr<OutputMethod>(const std::string&)>;
    using RefreshHook = RecordingStateMachine::RefreshHook;

    AppCore(Config config, bool verbose, Recognizer& recognizer,
            AssistantLauncher& launcher, OutputFactory output_factory,
            RefreshHook refresh = {});
    ~AppCore();

    AppCore(const AppCore&) = delete;
    AppCore& operator=(const AppCore&) = delete;

    // Opens the prompt store and loads history. A store that fails to open
    // leaves saving disabled.
    bool init();

    void toggle_recording();
    void stop_recording();

    void enter_editing();
    void update_edit_text(std::string text);
    void exit_editing();
    // Commit the edit, save it and leave editing.
    void save_and_exit_editing();

    void save_prompt();
    void launch_assistant();
    void copy_prompt();
    void inject_prompt();

    void select_prompt(int64_t id);
    void refresh_history();
    void refresh_multiplexer();

    void shutdown();

    RecordingState state() const { return machine_.state(); }
    const std::string& status() const { return machine_.status(); }
    std::string preview() const { return machine_.preview(); }
    const std::string& edit_text() const { return machine_.edit_text(); }
    const std::string& draft() const { return machine_.draft(); }

    std::optional<int64_t> active_prompt_id() const { return active_prompt_id_; }
    const std::optional<RunRecord>& last_run() const { return last_run_; }
    const std::vector<HistoryItem>& history() const { return history_; }
    const std::string& multiplexer_status() const { return multiplexer_status_; }
    const Config& config() const { return config_; }
    PromptDb& db() { return db_; }

    // "Mode: Recording …partial | Prompt: #3 | Model: small-en | Last run: 10:02:11 tmux:codex-3"
    std::string mode_line() const;
    // "Current prompt (VIEW)", "(RECORD)" or "(EDIT)"
    std::string prompt_title() const;

    static std::string format_run(const RunRecord& run);

private:
    // The text operations act on: the edit in progress, else the draft.
    std::string current_text() const;
    std::expected<void, std::string> deliver(const std::string& method, const std::string& text);
    void set_status(std::string status) { machine_.set_status(std::move(status)); }
    void log(const std::string& msg);

    Config config_;
    bool verbose_;
    AssistantLauncher& launcher_;
    OutputFactory output_factory_;

    RecordingStateMachine machine_;
    PromptDb db_;

    std::optional<int64_t> active_prompt_id_;
    std::optional<RunRecord> last_run_;
    std::vector<HistoryItem> history_;
    std::string multiplexer_status_;
};
