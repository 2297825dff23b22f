#include <catch2/catch.hpp>

#include "launch/tmux_launcher.hpp"
#include "platform/linux/process.hpp"
#include "test_support.hpp"

#include <string>

TEST_CASE("TmuxLauncher", "[launcher]") {
    TmpDir tmp;
    auto log = tmp.file("calls.log");

    // Records each invocation, one argument per line, and answers list-windows.
    auto fake_tmux = write_script(tmp.file("tmux"),
        "printf '%s\\n' \"$@\" >> " + log + "\n"
        "echo --- >> " + log + "\n"
        "case \"$1\" in\n"
        "  list-windows) printf '0:zsh\\n1:codex-3\\n' ;;\n"
        "esac\n"
        "exit 0\n");

    SECTION("BuildCommandQuotesPrompt") {
        REQUIRE(TmuxLauncher::build_command("codex", "fix the \"bug\"", {}) ==
                R"(codex "fix the \"bug\"")");
        REQUIRE(TmuxLauncher::build_command("codex", "a\nb", {"--full-auto", "-q"}) ==
                R"(codex "a\nb" --full-auto -q)");
    }

    SECTION("BuildCommandBlocksShellExpansion") {
        std::string prompt = "list files in $HOME and `id` or $(id)";
        auto cmd = TmuxLauncher::build_command("codex", prompt, {});
        REQUIRE(cmd == R"x(codex "list files in \$HOME and \`id\` or \$(id)")x");

        // Run it the way tmux does and check the assistant gets the text verbatim.
        auto out = tmp.file("argv.txt");
        auto assistant = write_script(tmp.file("assistant"), "printf '%s' \"$1\" > " + out + "\n");
        auto res = run_process({"/bin/sh", "-c", TmuxLauncher::build_command(assistant, prompt, {})});
        REQUIRE(res.has_value());
        REQUIRE(res->status.success());
        REQUIRE(read_file(out) == prompt);
    }

    SECTION("WindowNames") {
        TmuxLauncher launcher(fake_tmux, "codex");
        REQUIRE(launcher.window_name(12) == "codex-12");
        auto unsaved = launcher.window_name(std::nullopt);
        REQUIRE(unsaved.starts_with("codex-"));
        REQUIRE(unsaved.size() > 6);

        REQUIRE(TmuxLauncher::to_base36(0) == "0");
        REQUIRE(TmuxLauncher::to_base36(35) == "z");
        REQUIRE(TmuxLauncher::to_base36(36) == "10");
    }

    SECTION("LaunchRunsNewWindow") {
        TmuxLauncher launcher(fake_tmux, "codex", {"--full-auto"});
        auto res = launcher.launch(LaunchRequest{
            .prompt = "  refactor the parser  ",
            .workdir = tmp.path.string(),
            .prompt_id = 7,
        });
        REQUIRE(res.has_value());
        REQUIRE(res->window_name == "codex-7");
        REQUIRE(res->command == R"(codex "refactor the parser" --full-auto)");

        auto calls = read_file(log);
        REQUIRE(calls == "-V\n---\n"
                         "new-window\n-n\ncodex-7\n-c\n" + tmp.path.string() + "\n" +
                         R"(codex "refactor the parser" --full-auto)" "\n---\n");
    }

    SECTION("EmptyPromptRefused") {
        TmuxLauncher launcher(fake_tmux);
        auto res = launcher.launch(LaunchRequest{.prompt = "  \n "});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "Prompt is empty");
        REQUIRE_FALSE(fs::exists(log));
    }

    SECTION("MissingMultiplexer") {
        TmuxLauncher launcher("glu-no-such-tmux");
        auto res = launcher.launch(LaunchRequest{.prompt = "hello"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "glu-no-such-tmux executable not found in PATH. Please install glu-no-such-tmux.");
    }

    SECTION("NewWindowFailure") {
        auto failing = write_script(tmp.file("tmux-down"),
            "[ \"$1\" = -V ] && exit 0\n"
            "echo 'no server running on /tmp/tmux-1000/default' >&2\n"
            "exit 1\n");
        TmuxLauncher launcher(failing);
        auto res = launcher.launch(LaunchRequest{.prompt = "hello"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == failing + " new-window failed: no server running on /tmp/tmux-1000/default");
    }

    SECTION("ListWindows") {
        TmuxLauncher launcher(fake_tmux);
        auto windows = launcher.list_windows();
        REQUIRE(windows.has_value());
        REQUIRE(*windows == std::vector<std::string>{"0:zsh", "1:codex-3"});
        REQUIRE(read_file(log) == "list-windows\n-F\n#I:#W\n---\n");
    }

    SECTION("ListWindowsNotRunning") {
        auto down = write_script(tmp.file("tmux-down"), "echo 'no server running' >&2\nexit 1\n");
        TmuxLauncher launcher(down);
        auto windows = launcher.list_windows();
        REQUIRE_FALSE(windows.has_value());
        REQUIRE(windows.error() == "no server running");
    }
}
