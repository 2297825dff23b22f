#pragma once

#include "launcher.hpp"

// Opens a new tmux window running `<assistant> "<prompt>" [extra args]`.
class TmuxLauncher : public AssistantLauncher {
public:
    TmuxLauncher(std::string multiplexer = "tmux", std::string assistant = "codex",
                 std::vector<std::string> extra_args = {});

    std::expected<LaunchResult, std::string> launch(const LaunchRequest& request) override;
    std::expected<std::vector<std::string>, std::string> list_windows() override;
    const std::string& assistant() const override { return assistant_; }

    // The prompt is one double-quoted word for the shell tmux hands it to,
    // passed through literally.
    static std::string build_command(const std::string& assistant, const std::string& prompt,
                                     const std::vector<std::string>& extra_args);

    // <assistant>-<id>, or <assistant>-<base36 epoch millis> for unsaved prompts.
    std::string window_name(std::optional<int64_t> prompt_id) const;

    static std::string to_base36(uint64_t value);

private:
    std::expected<void, std::string> ensure_multiplexer();

    std::string multiplexer_;
    std::string assistant_;
    std::vector<std::string> extra_args_;
};
