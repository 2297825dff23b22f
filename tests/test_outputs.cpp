#include <catch2/catch.hpp>

#include "output/clipboard_output.hpp"
#include "output/xdotool_output.hpp"
#include "test_support.hpp"

#include <string>

TEST_CASE("ClipboardOutput", "[output]") {
    TmpDir tmp;
    auto sink = tmp.file("clipboard.txt");
    auto good = write_script(tmp.file("copy"), "cat > " + sink + "\n");
    auto broken = write_script(tmp.file("broken-copy"), "cat > /dev/null\nexit 1\n");

    SECTION("DefaultOrder") {
        auto wayland = ClipboardOutput::default_candidates(true);
        REQUIRE(wayland.size() == 2);
        REQUIRE(wayland[0] == std::vector<std::string>{"wl-copy", "-n"});
        REQUIRE(wayland[1] == std::vector<std::string>{"xclip", "-selection", "clipboard"});

        auto x11 = ClipboardOutput::default_candidates(false);
        REQUIRE(x11[0][0] == "xclip");
        REQUIRE(x11[1][0] == "wl-copy");
    }

    SECTION("PipesTextToFirstWorkingTool") {
        ClipboardOutput clip({{"glu-no-such-clipboard"}, {broken}, {good}});
        auto res = clip.deliver("copy me");
        REQUIRE(res.has_value());
        REQUIRE(read_file(sink) == "copy me");
    }

    SECTION("AllToolsFail") {
        ClipboardOutput clip({{"glu-no-such-clipboard"}, {broken}});
        auto res = clip.deliver("lost");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "Clipboard copy failed (wl-copy/xclip not found).");
    }
}

TEST_CASE("XdotoolOutput", "[output]") {
    TmpDir tmp;
    auto log = tmp.file("xdotool.log");
    auto fake = write_script(tmp.file("xdotool"),
        "[ \"$1\" = -v ] && exit 0\n"
        "printf '%s\\n' \"$@\" > " + log + "\n");

    SECTION("BuildCommand") {
        XdotoolOutput out("0x3a00007");
        REQUIRE(out.build_command("hi there") == std::vector<std::string>{
            "xdotool", "windowactivate", "--sync", "0x3a00007", "key", "ctrl+a", "ctrl+k",
            "type", "--delay", "0", "hi there", "key", "Return"});
    }

    SECTION("TypesIntoWindow") {
        XdotoolOutput out("42", fake);
        REQUIRE(out.deliver("hello world").has_value());
        REQUIRE(read_file(log) ==
                "windowactivate\n--sync\n42\nkey\nctrl+a\nctrl+k\n"
                "type\n--delay\n0\nhello world\nkey\nReturn\n");
    }

    SECTION("NoWindow") {
        XdotoolOutput out("", fake);
        auto res = out.deliver("x");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "Set XDO_WINDOW_ID to target window id (xdotool search...).");
    }

    SECTION("NotInstalled") {
        XdotoolOutput out("42", "glu-no-such-xdotool");
        auto res = out.deliver("x");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "xdotool not found in PATH.");
    }

    SECTION("FailureDetail") {
        auto failing = write_script(tmp.file("xdotool-bad"),
            "[ \"$1\" = -v ] && exit 0\n"
            "echo 'XGetWindowProperty failed' >&2\n"
            "exit 1\n");
        XdotoolOutput out("42", failing);
        auto res = out.deliver("x");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "Inject failed: XGetWindowProperty failed");
    }
}
