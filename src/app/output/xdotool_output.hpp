#pragma once

#include "output.hpp"

#include <string>
#include <vector>

// Types the text into an X11 window, replacing whatever line it holds, and
// presses Return.
class XdotoolOutput : public OutputMethod {
public:
    explicit XdotoolOutput(std::string window, std::string program = "xdotool");

    std::expected<void, std::string> deliver(const std::string& text) override;

    std::vector<std::string> build_command(const std::string& text) const;

    const std::string& window() const { return window_; }

private:
    bool available() const;

    std::string window_;
    std::string program_;
};
