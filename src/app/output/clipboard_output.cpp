#include "clipboard_output.hpp"

#include "platform/linux/process.hpp"

#include <cerrno>
#include <cstdlib>
#include <print>
#include <unistd.h>

ClipboardOutput::ClipboardOutput()
    : candidates_(default_candidates(std::getenv("WAYLAND_DISPLAY") != nullptr)) {}

ClipboardOutput::ClipboardOutput(std::vector<Command> candidates)
    : candidates_(std::move(candidates)) {}

std::vector<ClipboardOutput::Command> ClipboardOutput::default_candidates(bool wayland) {
    Command wl_copy{"wl-copy", "-n"};
    Command xclip{"xclip", "-selection", "clipboard"};
    if (wayland) return {wl_copy, xclip};
    return {xclip, wl_copy};
}

std::expected<void, std::string> ClipboardOutput::deliver(const std::string& text) {
    for (const auto& cmd : candidates_) {
        if (cmd.empty()) continue;
        auto res = pipe_to(cmd, text);
        if (res) return {};
        std::println(stderr, "clipboard: {}", res.error());
    }
    return std::unexpected("Clipboard copy failed (wl-copy/xclip not found).");
}

// Only stdin is piped: the clipboard owner these tools leave behind keeps
// running, and must not hold on to anything we wait for.
std::expected<void, std::string> ClipboardOutput::pipe_to(const Command& cmd, const std::string& text) {
    auto child = spawn_process(cmd, SpawnOptions{.pipe_stdin = true});
    if (!child) return std::unexpected(child.error());

    int fd = child->stdin_fd;
    size_t total_written = 0;
    while (total_written < text.size()) {
        ssize_t n = ::write(fd, text.data() + total_written, text.size() - total_written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break; // reader went away; the exit status says why
        }
        total_written += static_cast<size_t>(n);
    }
    ::close(fd);

    auto status = wait_process(child->pid);
    if (!status) return std::unexpected(status.error());
    if (!status->success()) return std::unexpected(cmd[0] + " " + status->describe());
    return {};
}
