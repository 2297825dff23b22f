#pragma once

#include "output.hpp"

#include <string>
#include <vector>

// Pipes the text into the first clipboard tool that accepts it.
class ClipboardOutput : public OutputMethod {
public:
    using Command = std::vector<std::string>;

    // Candidate order follows WAYLAND_DISPLAY.
    ClipboardOutput();
    explicit ClipboardOutput(std::vector<Command> candidates);

    std::expected<void, std::string> deliver(const std::string& text) override;

    const std::vector<Command>& candidates() const { return candidates_; }

    // wl-copy first under Wayland, xclip first otherwise.
    static std::vector<Command> default_candidates(bool wayland);

private:
    std::expected<void, std::string> pipe_to(const Command& cmd, const std::string& text);

    std::vector<Command> candidates_;
};
