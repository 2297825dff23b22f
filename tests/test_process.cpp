#include <catch2/catch.hpp>

#include "platform/linux/process.hpp"
#include "test_support.hpp"

#include <csignal>
#include <string>
#include <sys/wait.h>

TEST_CASE("Process helpers", "[process]") {

    SECTION("CollectsOutput") {
        auto res = run_process({"/bin/sh", "-c", "echo out; echo err >&2; exit 4"});
        REQUIRE(res.has_value());
        REQUIRE(res->out == "out\n");
        REQUIRE(res->err == "err\n");
        REQUIRE(res->status.kind == ExitStatus::Kind::Exited);
        REQUIRE(res->status.code == 4);
        REQUIRE_FALSE(res->status.success());
        REQUIRE(res->status.describe() == "exited with code 4");
    }

    SECTION("FeedsStdin") {
        std::string big(200000, 'x');
        auto res = run_process({"/bin/sh", "-c", "wc -c"}, big);
        REQUIRE(res.has_value());
        REQUIRE(res->status.success());
        REQUIRE(std::stoul(res->out) == big.size());
    }

    SECTION("Workdir") {
        TmpDir tmp;
        auto res = run_process({"pwd"}, {}, tmp.path.string());
        REQUIRE(res.has_value());
        REQUIRE(fs::equivalent(fs::path(res->out.substr(0, res->out.size() - 1)), tmp.path));
    }

    SECTION("ExecFailureReportedBySpawn") {
        auto res = run_process({"glu-definitely-not-installed"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == "glu-definitely-not-installed: No such file or directory");
    }

    SECTION("EmptyCommand") {
        REQUIRE_FALSE(spawn_process({}).has_value());
    }

    SECTION("SignaledStatus") {
        auto child = spawn_process({"/bin/sh", "-c", "kill -9 $$"});
        REQUIRE(child.has_value());
        auto status = wait_process(child->pid);
        REQUIRE(status.has_value());
        REQUIRE(status->kind == ExitStatus::Kind::Signaled);
        REQUIRE(status->code == SIGKILL);
        REQUIRE(status->describe().starts_with("killed by signal 9"));
    }

    SECTION("UnpipedStreamsAreDevNull") {
        auto child = spawn_process({"/bin/sh", "-c", "read line && exit 0; exit 7"});
        REQUIRE(child.has_value());
        REQUIRE(child->stdin_fd == -1);
        REQUIRE(child->stdout_fd == -1);
        auto status = wait_process(child->pid);
        REQUIRE(status.has_value());
        REQUIRE(status->code == 7); // read hits EOF on /dev/null
    }
}
