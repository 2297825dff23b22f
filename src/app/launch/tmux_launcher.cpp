#include "tmux_launcher.hpp"

#include "platform/linux/process.hpp"
#include "text_util.hpp"

#include <chrono>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <print>

namespace fs = std::filesystem;

TmuxLauncher::TmuxLauncher(std::string multiplexer, std::string assistant,
                           std::vector<std::string> extra_args)
    : multiplexer_(std::move(multiplexer))
    , assistant_(std::move(assistant))
    , extra_args_(std::move(extra_args)) {}

std::string TmuxLauncher::build_command(const std::string& assistant, const std::string& prompt,
                                        const std::vector<std::string>& extra_args) {
    // dump() escapes quotes and backslashes; '$' and '`' still expand inside
    // double quotes.
    std::string cmd = assistant + " ";
    for (char c : nlohmann::json(prompt).dump()) {
        if (c == '$' || c == '`') cmd += '\\';
        cmd += c;
    }
    for (const auto& arg : extra_args) {
        cmd += " ";
        cmd += arg;
    }
    return cmd;
}

std::string TmuxLauncher::to_base36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string out;
    while (value > 0) {
        out.insert(out.begin(), digits[value % 36]);
        value /= 36;
    }
    return out;
}

std::string TmuxLauncher::window_name(std::optional<int64_t> prompt_id) const {
    if (prompt_id) return assistant_ + "-" + std::to_string(*prompt_id);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return assistant_ + "-" + to_base36(static_cast<uint64_t>(ms));
}

std::expected<void, std::string> TmuxLauncher::ensure_multiplexer() {
    auto res = run_process({multiplexer_, "-V"});
    if (!res) {
        std::println(stderr, "launcher: {}", res.error());
        return std::unexpected(multiplexer_ + " executable not found in PATH. Please install " +
                               multiplexer_ + ".");
    }
    return {};
}

std::expected<LaunchResult, std::string> TmuxLauncher::launch(const LaunchRequest& request) {
    auto prompt = text::trim(request.prompt);
    if (prompt.empty()) return std::unexpected("Prompt is empty");

    if (auto ok = ensure_multiplexer(); !ok) return std::unexpected(ok.error());

    std::error_code ec;
    fs::path workdir = request.workdir.empty() ? fs::current_path(ec) : fs::absolute(request.workdir, ec);
    if (ec) return std::unexpected("cannot resolve working directory: " + ec.message());

    LaunchResult result{
        .window_name = window_name(request.prompt_id),
        .command = build_command(assistant_, prompt, extra_args_),
    };

    auto res = run_process({multiplexer_, "new-window", "-n", result.window_name,
                            "-c", workdir.string(), result.command});
    if (!res) return std::unexpected(res.error());
    if (!res->status.success()) {
        auto detail = text::trim(res->err);
        if (detail.empty()) detail = res->status.describe();
        return std::unexpected(multiplexer_ + " new-window failed: " + detail);
    }

    return result;
}

std::expected<std::vector<std::string>, std::string> TmuxLauncher::list_windows() {
    auto res = run_process({multiplexer_, "list-windows", "-F", "#I:#W"});
    if (!res) return std::unexpected(res.error());
    if (!res->status.success()) {
        auto detail = text::trim(res->err);
        return std::unexpected(detail.empty() ? res->status.describe() : detail);
    }

    std::vector<std::string> windows;
    size_t pos = 0;
    const auto& out = res->out;
    while (pos < out.size()) {
        auto nl = out.find('\n', pos);
        if (nl == std::string::npos) nl = out.size();
        auto line = text::trim(std::string_view(out).substr(pos, nl - pos));
        if (!line.empty()) windows.push_back(std::move(line));
        pos = nl + 1;
    }
    return windows;
}
