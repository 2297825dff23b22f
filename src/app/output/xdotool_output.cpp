#include "xdotool_output.hpp"

#include "platform/linux/process.hpp"
#include "text_util.hpp"

XdotoolOutput::XdotoolOutput(std::string window, std::string program)
    : window_(std::move(window)), program_(std::move(program)) {}

std::vector<std::string> XdotoolOutput::build_command(const std::string& text) const {
    return {
        program_, "windowactivate", "--sync", window_,
        "key", "ctrl+a", "ctrl+k",
        "type", "--delay", "0", text,
        "key", "Return",
    };
}

bool XdotoolOutput::available() const {
    auto res = run_process({program_, "-v"});
    return res && res->status.success();
}

std::expected<void, std::string> XdotoolOutput::deliver(const std::string& text) {
    if (window_.empty()) {
        return std::unexpected("Set XDO_WINDOW_ID to target window id (xdotool search...).");
    }
    if (!available()) {
        return std::unexpected("xdotool not found in PATH.");
    }

    auto res = run_process(build_command(text));
    if (!res) return std::unexpected("Inject failed: " + res.error());
    if (!res->status.success()) {
        auto detail = text::trim(res->err);
        if (detail.empty()) detail = res->status.describe();
        return std::unexpected("Inject failed: " + detail);
    }
    return {};
}
