#pragma once

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

struct LaunchRequest {
    std::string prompt;
    std::string workdir;             // empty: current directory
    std::optional<int64_t> prompt_id; // names the window when the prompt is saved
};

struct LaunchResult {
    std::string window_name;
    std::string command;
};

// Starts the coding assistant on a prompt somewhere the user can attach to.
class AssistantLauncher {
public:
    virtual ~AssistantLauncher() = default;

    virtual std::expected<LaunchResult, std::string> launch(const LaunchRequest& request) = 0;

    // "index:name" per window of the current multiplexer session.
    virtual std::expected<std::vector<std::string>, std::string> list_windows() = 0;

    virtual const std::string& assistant() const = 0;
};
