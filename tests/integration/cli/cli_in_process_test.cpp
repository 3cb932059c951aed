// WatchmanCLI driven in-process against a live daemon

#include <catch2/catch_test_macros.hpp>

#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include "../daemon/test_daemon_harness.h"
#include <watchman/cli/watchman_cli.h>
#include <watchman/protocol/bser.h>
#include <watchman/protocol/pdu.h>
#include <watchman/version.hpp>

using namespace watchman;
using nlohmann::json;

namespace {

constexpr const char* kUnknownCommandError =
    "watchman::CommandValidationError: failed to validate command: unknown command "
    "unknown-command";

struct CliRun {
    int exitCode = -1;
    std::string out;
    std::string err;
};

CliRun runCli(std::vector<std::string> args, const std::string& stdinData = "") {
    args.insert(args.begin(), "watchman");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::ostringstream out;
    std::ostringstream err;
    std::istringstream in(stdinData);
    cli::WatchmanCLI app(out, err, in);

    CliRun result;
    result.exitCode = app.run(static_cast<int>(args.size()), argv.data());
    result.out = out.str();
    result.err = err.str();
    return result;
}

// Global options that keep the user's config and environment out of the run
std::vector<std::string> baseArgs(const test::DaemonHarness& harness) {
    return {"--config", harness.configPath().string(), "-U", harness.socketPath().string()};
}

std::vector<std::string> withArgs(std::vector<std::string> base,
                                  std::initializer_list<std::string> more) {
    base.insert(base.end(), more);
    return base;
}

} // namespace

TEST_CASE("CLI prints the unknown command error from the daemon", "[cli][integration]") {
    test::DaemonHarness harness;
    REQUIRE(harness.start());

    SECTION("pretty JSON") {
        auto r = runCli(withArgs(baseArgs(harness), {"--pretty", "unknown-command"}));
        CHECK(r.exitCode == 0);
        CHECK(r.err.empty());
        REQUIRE_FALSE(r.out.empty());
        CHECK(r.out.find("\n    \"error\": ") != std::string::npos);
        auto resp = json::parse(r.out);
        CHECK(resp.at("error") == kUnknownCommandError);
        CHECK(resp.at("version") == kVersionString);
    }
    SECTION("BSER on the wire, JSON on stdout") {
        auto r = runCli(
            withArgs(baseArgs(harness), {"--server-encoding", "bser", "unknown-command"}));
        CHECK(r.exitCode == 0);
        CHECK(r.err.empty());
        REQUIRE(r.out.back() == '\n');
        CHECK(json::parse(r.out).at("error") == kUnknownCommandError);
    }
    SECTION("BSER on stdout") {
        auto r = runCli(
            withArgs(baseArgs(harness), {"--output-encoding", "bser", "unknown-command"}));
        CHECK(r.exitCode == 0);
        CHECK(r.err.empty());
        auto resp = protocol::bserDecode(r.out);
        REQUIRE(resp);
        CHECK(resp.value().at("error") == kUnknownCommandError);
    }
}

TEST_CASE("CLI sends dash-prefixed names after --", "[cli][integration]") {
    test::DaemonHarness harness;
    REQUIRE(harness.start());

    auto r = runCli(withArgs(baseArgs(harness), {"--", "-x"}));
    CHECK(r.exitCode == 0);
    CHECK(r.err.empty());
    CHECK(json::parse(r.out).at("error") ==
          "watchman::CommandValidationError: failed to validate command: unknown command -x");

    auto bogus = runCli(withArgs(baseArgs(harness), {"-x"}));
    CHECK(bogus.exitCode == 1);
    CHECK(bogus.out.empty());
}

TEST_CASE("CLI relays successful responses", "[cli][integration]") {
    test::DaemonHarness harness;
    REQUIRE(harness.start());

    auto r = runCli(withArgs(baseArgs(harness), {"version"}));
    CHECK(r.exitCode == 0);
    CHECK(r.err.empty());
    CHECK(r.out == "{\"version\":\"" + std::string(kVersionString) + "\"}\n");

    auto pid = runCli(withArgs(baseArgs(harness), {"--no-pretty", "-p", "get-pid"}));
    CHECK(pid.exitCode == 0);
    CHECK(json::parse(pid.out).at("pid") == static_cast<long>(::getpid()));
    CHECK(pid.out.find('\n') == pid.out.size() - 1);
}

TEST_CASE("CLI reads the command from stdin with -j", "[cli][integration]") {
    test::DaemonHarness harness;
    REQUIRE(harness.start());

    SECTION("JSON input") {
        auto r = runCli(withArgs(baseArgs(harness), {"-j"}), "[\"unknown-command\"]\n");
        CHECK(r.exitCode == 0);
        CHECK(json::parse(r.out).at("error") == kUnknownCommandError);
    }
    SECTION("BSER input") {
        auto pdu = protocol::bserEncode(json::array({"unknown-command"}));
        REQUIRE(pdu);
        auto r = runCli(withArgs(baseArgs(harness), {"-j"}), pdu.value());
        CHECK(r.exitCode == 0);
        CHECK(json::parse(r.out).at("error") == kUnknownCommandError);
    }
    SECTION("malformed input") {
        auto r = runCli(withArgs(baseArgs(harness), {"-j"}), "[\"unknown-command\"");
        CHECK(r.exitCode == 1);
        CHECK(r.out.empty());
        CHECK(r.err.rfind("watchman: failed to parse command from stdin: invalid json", 0) == 0);
    }
    SECTION("empty input") {
        auto r = runCli(withArgs(baseArgs(harness), {"-j"}), "");
        CHECK(r.exitCode == 1);
        CHECK(r.err.find("no input") != std::string::npos);
    }
    SECTION("command on both stdin and the command line") {
        auto r = runCli(withArgs(baseArgs(harness), {"-j", "version"}), "[\"version\"]\n");
        CHECK(r.exitCode == 1);
        CHECK(r.out.empty());
    }
}

TEST_CASE("CLI answers client-mode commands without a daemon", "[cli][integration]") {
    auto dir = test_support::TempDirScope::unique_under("wm-cli");
    auto config = dir.write("config.toml");
    auto sock = (dir.path() / "no-daemon.sock").string();

    auto r = runCli({"--config", config.string(), "-U", sock, "get-sockname"});
    CHECK(r.exitCode == 0);
    CHECK(r.err.empty());
    auto resp = json::parse(r.out);
    CHECK(resp.at("sockname") == sock);
    CHECK(resp.at("version") == kVersionString);
}

TEST_CASE("CLI reports transport failures on stderr", "[cli][integration]") {
    auto dir = test_support::TempDirScope::unique_under("wm-cli");
    auto config = dir.write("config.toml");

    auto r = runCli({"--config", config.string(), "-U", (dir.path() / "sock").string(),
                     "unknown-command"});
    CHECK(r.exitCode == 1);
    CHECK(r.out.empty());
    CHECK(r.err.rfind("watchman: [ipc:socket_missing] ", 0) == 0);
    CHECK(r.err.find("Hint: ") != std::string::npos);
}

TEST_CASE("CLI takes defaults from the config file", "[cli][integration]") {
    test::DaemonHarness harness;
    REQUIRE(harness.start());

    auto scratch = test_support::TempDirScope::unique_under("wm-cli");
    auto config = scratch.write("client.toml", "[client]\n"
                                               "socket_path = \"" +
                                                   harness.socketPath().string() +
                                                   "\"\n"
                                                   "server_encoding = \"bser\"\n"
                                                   "timeout_ms = 5000\n");

    auto r = runCli({"--config", config.string(), "unknown-command"});
    CHECK(r.exitCode == 0);
    CHECK(r.err.empty());
    CHECK(json::parse(r.out).at("error") == kUnknownCommandError);
}

TEST_CASE("CLI option errors", "[cli][integration]") {
    auto dir = test_support::TempDirScope::unique_under("wm-cli");
    auto config = dir.write("config.toml");

    SECTION("invalid encoding") {
        auto r = runCli({"--config", config.string(), "--server-encoding", "xml", "version"});
        CHECK(r.exitCode == 1);
        CHECK(r.out.empty());
        CHECK_FALSE(r.err.empty());
    }
    SECTION("unknown option") {
        auto r = runCli({"--config", config.string(), "--bogus", "version"});
        CHECK(r.exitCode == 1);
        CHECK(r.out.empty());
        CHECK(r.err.find("--bogus") != std::string::npos);
    }
    SECTION("missing config file") {
        auto r = runCli({"--config", (dir.path() / "missing.toml").string(), "version"});
        CHECK(r.exitCode == 1);
        CHECK(r.err.find("config file not found") != std::string::npos);
    }
    SECTION("no command") {
        auto r = runCli({"--config", config.string()});
        CHECK(r.exitCode == 1);
        CHECK(r.err.find("no command specified") != std::string::npos);
    }
    SECTION("version flag") {
        auto r = runCli({"--version"});
        CHECK(r.exitCode == 0);
        CHECK(r.out.find(kVersionString) != std::string::npos);
    }
}
