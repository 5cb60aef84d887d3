#include <catch2/catch_test_macros.hpp>

#include "platform/linux/posix_process_runner.hpp"
#include "test_support.hpp"

#include <chrono>
#include <stop_token>
#include <thread>

using namespace std::chrono_literals;
using test_support::TmpDir;

TEST_CASE("PosixProcessRunner", "[process]") {
    PosixProcessRunner runner(200ms);

    SECTION("CapturesStdoutAndStderr") {
        auto res = runner.run({"/bin/sh", "-c", "echo out; echo err >&2"});
        REQUIRE(res.has_value());
        REQUIRE(res->ok());
        REQUIRE(res->exit_code == 0);
        REQUIRE(res->out == "out\n");
        REQUIRE(res->err == "err\n");
    }

    SECTION("NonZeroExitIsAResult") {
        auto res = runner.run({"/bin/sh", "-c", "exit 3"});
        REQUIRE(res.has_value());
        REQUIRE_FALSE(res->ok());
        REQUIRE(res->exit_code == 3);
        REQUIRE_FALSE(res->interrupted());
    }

    SECTION("MissingProgramCannotStart") {
        auto res = runner.run({"wk-test-no-such-program"});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().find("wk-test-no-such-program") != std::string::npos);
    }

    SECTION("EmptyCommandLine") {
        auto res = runner.run({});
        REQUIRE_FALSE(res.has_value());
    }

    SECTION("RunsInWorkingDirectory") {
        TmpDir dir;
        ProcessOptions opts;
        opts.cwd = dir.path;
        auto res = runner.run({"/bin/sh", "-c", "pwd"}, opts);
        REQUIRE(res.has_value());
        auto out = res->out;
        if (!out.empty() && out.back() == '\n') out.pop_back();
        REQUIRE(std::filesystem::equivalent(out, dir.path));
    }
}

TEST_CASE("PosixProcessRunner interruption", "[process]") {
    PosixProcessRunner runner(200ms);

    SECTION("DeadlineKillsChild") {
        ProcessOptions opts;
        opts.deadline = std::chrono::steady_clock::now() + 200ms;
        auto start = std::chrono::steady_clock::now();
        auto res = runner.run({"/bin/sh", "-c", "sleep 30"}, opts);
        REQUIRE(res.has_value());
        REQUIRE(res->timed_out);
        REQUIRE_FALSE(res->cancelled);
        REQUIRE_FALSE(res->ok());
        REQUIRE(std::chrono::steady_clock::now() - start < 10s);
    }

    SECTION("StopTokenCancelsChild") {
        std::stop_source source;
        ProcessOptions opts;
        opts.stop = source.get_token();
        std::jthread canceller([&source] {
            std::this_thread::sleep_for(200ms);
            source.request_stop();
        });
        auto res = runner.run({"/bin/sh", "-c", "sleep 30"}, opts);
        REQUIRE(res.has_value());
        REQUIRE(res->cancelled);
        REQUIRE(res->interrupted());
    }
}

TEST_CASE("find_executable", "[process]") {
    TmpDir dir;
    test_support::write_script(dir / "wk-tool", "exit 0\n");
    test_support::write_file(dir / "wk-plain", "data");

    auto found = find_executable("wk-tool", dir.path.string());
    REQUIRE(found.has_value());
    REQUIRE(found->string() == (dir / "wk-tool").string());
    REQUIRE_FALSE(find_executable("wk-plain", dir.path.string()).has_value());
    REQUIRE_FALSE(find_executable("wk-missing", dir.path.string()).has_value());
    REQUIRE(find_executable((dir / "wk-tool").string()).has_value());
    REQUIRE(find_executable("sh").has_value());
}
