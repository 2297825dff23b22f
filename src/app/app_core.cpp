#include "app_core.hpp"

#include "text_util.hpp"

#include <filesystem>
#include <format>
#include <print>

namespace {

RecognizerOptions recognizer_options(const Config& config) {
    return RecognizerOptions{
        .model_path = config.model_path(),
        .sample_rate = config.recognizer.sample_rate,
        .device = config.recognizer.device,
    };
}

} // namespace

AppCore::AppCore(Config config, bool verbose, Recognizer& recognizer,
                 AssistantLauncher& launcher, OutputFactory output_factory,
                 RefreshHook refresh)
    : config_(std::move(config)), verbose_(verbose),
      launcher_(launcher),
      output_factory_(std::move(output_factory)),
      machine_(recognizer, recognizer_options(config_), std::move(refresh)) {}

AppCore::~AppCore() = default;

bool AppCore::init() {
    auto path = config_.db_path();
    if (!db_.open(path)) {
        std::println(stderr, "Warning: prompt DB failed to open, saving disabled");
        refresh_multiplexer();
        return false;
    }
    log("prompt DB: " + path);

    refresh_history();
    return true;
}

void AppCore::toggle_recording() {
    if (machine_.state() == RecordingState::Recording) {
        stop_recording();
        return;
    }

    auto started = machine_.start_recording();
    if (!started) {
        log("start failed: " + started.error());
        return;
    }

    // A fresh recording is a new, unsaved prompt.
    active_prompt_id_.reset();
    last_run_.reset();
    log("recording started");
}

void AppCore::stop_recording() {
    if (machine_.state() != RecordingState::Recording) return;
    machine_.stop_recording();
    log("recording stopped");
}

void AppCore::enter_editing() {
    machine_.enter_editing();
}

void AppCore::update_edit_text(std::string text) {
    machine_.update_edit_text(std::move(text));
}

void AppCore::exit_editing() {
    machine_.exit_editing();
}

void AppCore::save_and_exit_editing() {
    machine_.exit_editing();
    save_prompt();
}

void AppCore::save_prompt() {
    auto content = text::trim(current_text());
    if (content.empty()) {
        set_status("Nothing to save – prompt is empty.");
        return;
    }

    auto record = active_prompt_id_ ? db_.update_prompt(*active_prompt_id_, content)
                                    : db_.save_prompt(content);
    if (!record) {
        set_status("Save failed: " + record.error());
        return;
    }

    active_prompt_id_ = record->id;
    log(std::format("saved prompt #{}", record->id));
    refresh_history();
    set_status(std::format("Saved prompt #{} ({}).", record->id, record->created_at));
}

void AppCore::launch_assistant() {
    const auto& name = launcher_.assistant();
    auto prompt = text::trim(current_text());
    if (prompt.empty()) {
        set_status("Cannot launch " + name + " – prompt is empty.");
        return;
    }

    if (!active_prompt_id_) {
        save_prompt();
    }

    auto launched = launcher_.launch(LaunchRequest{
        .prompt = prompt,
        .workdir = {},
        .prompt_id = active_prompt_id_,
    });
    if (!launched) {
        set_status("Failed to launch " + name + ": " + launched.error());
        return;
    }
    log("launched: " + launched->command);

    if (active_prompt_id_) {
        auto run = db_.log_run(*active_prompt_id_, launched->command, launched->window_name);
        if (run) last_run_ = *run;
        else log("run not recorded: " + run.error());
    }

    refresh_history();
    set_status(std::format("{} launched in {} window \"{}\".", name,
                           config_.launcher.multiplexer, launched->window_name));
}

void AppCore::copy_prompt() {
    auto prompt = text::trim(current_text());
    if (prompt.empty()) {
        set_status("Nothing to copy – prompt is empty.");
        return;
    }

    auto res = deliver("clipboard", prompt);
    set_status(res ? "Prompt copied to clipboard." : res.error());
}

void AppCore::inject_prompt() {
    auto prompt = text::trim(current_text());
    if (prompt.empty()) {
        set_status("Nothing to inject – prompt is empty.");
        return;
    }

    auto res = deliver("xdotool", prompt);
    set_status(res ? "Injected prompt via xdotool." : res.error());
}

void AppCore::select_prompt(int64_t id) {
    auto prompt = db_.get_prompt(id);
    if (!prompt) {
        set_status(std::format("Prompt with id {} not found", id));
        return;
    }

    if (!machine_.replace_draft(prompt->text)) {
        set_status("Leave edit mode before loading a prompt.");
        return;
    }

    active_prompt_id_ = prompt->id;
    last_run_ = db_.last_run_for_prompt(prompt->id);
    set_status(std::format("Loaded prompt #{}.", prompt->id));
}

void AppCore::refresh_history() {
    history_.clear();
    for (auto& prompt : db_.list_prompts(config_.history_limit)) {
        HistoryItem item;
        item.label = std::format("#{}", prompt.id);
        item.description = text::squash_whitespace(text::utf8_prefix(prompt.text, 60));
        item.last_run = db_.last_run_for_prompt(prompt.id);
        if (item.last_run) {
            item.description += " (last run " + PromptDb::local_time(item.last_run->created_at, true) + ")";
        }
        item.prompt = std::move(prompt);
        history_.push_back(std::move(item));
    }
    refresh_multiplexer();
}

void AppCore::refresh_multiplexer() {
    const auto& mux = config_.launcher.multiplexer;
    auto windows = launcher_.list_windows();
    if (!windows) {
        multiplexer_status_ = mux + ": not running";
        return;
    }
    if (windows->empty()) {
        multiplexer_status_ = mux + ": no windows";
        return;
    }

    std::string joined;
    for (const auto& w : *windows) {
        if (!joined.empty()) joined += " | ";
        joined += w;
    }
    multiplexer_status_ = mux + " windows: " + joined;
}

void AppCore::shutdown() {
    stop_recording();
}

std::string AppCore::mode_line() const {
    std::string line = "Mode: " + std::string(to_string(machine_.state()));
    if (machine_.state() == RecordingState::Recording && !machine_.partial().empty()) {
        line += " …partial";
    }

    line += " | Prompt: ";
    line += active_prompt_id_ ? std::format("#{}", *active_prompt_id_) : "unsaved";

    auto model = std::filesystem::path(machine_.options().model_path);
    if (!model.has_filename()) model = model.parent_path();
    line += " | Model: " + model.filename().string();

    if (last_run_) line += " | Last run: " + format_run(*last_run_);
    return line;
}

std::string AppCore::prompt_title() const {
    switch (machine_.state()) {
        case RecordingState::Editing: return "Current prompt (EDIT)";
        case RecordingState::Recording: return "Current prompt (RECORD)";
        case RecordingState::Idle: break;
    }
    return "Current prompt (VIEW)";
}

std::string AppCore::format_run(const RunRecord& run) {
    auto out = PromptDb::local_time(run.created_at);
    if (!run.window_name.empty()) out += " tmux:" + run.window_name;
    return out;
}

std::string AppCore::current_text() const {
    if (machine_.state() == RecordingState::Editing) return machine_.edit_text();
    return machine_.draft();
}

std::expected<void, std::string> AppCore::deliver(const std::string& method, const std::string& text) {
    auto output = output_factory_ ? output_factory_(method) : nullptr;
    if (!output) return std::unexpected("Output method unavailable: " + method);

    auto res = output->deliver(text);
    if (!res) log(method + " delivery failed: " + res.error());
    return res;
}

void AppCore::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[glu-code] {}", msg);
    }
}
