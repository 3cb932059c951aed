// The watchman binary as a user runs it: exit status and the split between
// stdout and stderr.

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <cerrno>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../daemon/test_daemon_harness.h"
#include <watchman/version.hpp>

#ifndef WATCHMAN_CLI_BINARY
#error "WATCHMAN_CLI_BINARY must point at the built watchman executable"
#endif

using nlohmann::json;

namespace {

struct ProcessResult {
    int exitCode = -1;
    std::string out;
    std::string err;
};

std::string drain(int fd) {
    std::string data;
    char buf[4096];
    for (;;) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            data.append(buf, static_cast<size_t>(n));
        } else if (n == 0 || errno != EINTR) {
            break;
        }
    }
    ::close(fd);
    return data;
}

ProcessResult runWatchman(const std::vector<std::string>& args) {
    int outPipe[2];
    int errPipe[2];
    REQUIRE(::pipe(outPipe) == 0);
    REQUIRE(::pipe(errPipe) == 0);

    std::vector<std::string> storage{WATCHMAN_CLI_BINARY};
    storage.insert(storage.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : storage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    REQUIRE(pid >= 0);
    if (pid == 0) {
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(errPipe[1], STDERR_FILENO);
        ::close(outPipe[0]);
        ::close(errPipe[0]);
        ::execv(argv[0], argv.data());
        ::_exit(127);
    }

    ::close(outPipe[1]);
    ::close(errPipe[1]);
    // Responses are far below the pipe capacity, so draining in turn cannot stall
    ProcessResult result;
    result.out = drain(outPipe[0]);
    result.err = drain(errPipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    return result;
}

} // namespace

TEST_CASE("watchman unknown-command prints the validation error on stdout",
          "[cli][integration][unknown-command]") {
    watchman::test::DaemonHarness harness;
    REQUIRE(harness.start());

    auto encoding = GENERATE(as<std::string>{}, "json", "bser");
    CAPTURE(encoding);

    auto r = runWatchman({"--config", harness.configPath().string(), "-U",
                          harness.socketPath().string(), "--server-encoding", encoding,
                          "--pretty", "unknown-command"});

    CHECK(r.exitCode == 0);
    CHECK(r.err.empty());
    REQUIRE_FALSE(r.out.empty());

    auto resp = json::parse(r.out);
    CHECK(resp.at("error") ==
          "watchman::CommandValidationError: failed to validate command: unknown command "
          "unknown-command");
    CHECK(resp.at("version") == watchman::kVersionString);
}

TEST_CASE("watchman exits non-zero when the service is unreachable", "[cli][integration]") {
    auto dir = watchman::test_support::TempDirScope::unique_under("wm-bin");
    auto config = dir.write("config.toml");

    auto r = runWatchman({"--config", config.string(), "-U", (dir.path() / "sock").string(),
                          "unknown-command"});
    CHECK(r.exitCode == 1);
    CHECK(r.out.empty());
    CHECK(r.err.rfind("watchman: [ipc:socket_missing] ", 0) == 0);
}

TEST_CASE("watchman repeats the same unknown-command answer byte for byte",
          "[cli][integration][unknown-command]") {
    watchman::test::DaemonHarness harness;
    REQUIRE(harness.start());

    const std::vector<std::string> args{"--config", harness.configPath().string(), "-U",
                                        harness.socketPath().string(), "--pretty",
                                        "unknown-command"};
    auto first = runWatchman(args);
    auto second = runWatchman(args);

    REQUIRE(first.exitCode == 0);
    REQUIRE(second.exitCode == 0);
    CHECK(json::parse(first.out).at("error") == json::parse(second.out).at("error"));
    // The envelope carries nothing per-request, so the whole output matches
    CHECK(first.out == second.out);
}
