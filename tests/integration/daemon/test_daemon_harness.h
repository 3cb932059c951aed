// Lightweight RAII harness to start/stop a WatchmanDaemon for integration tests
#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <thread>
#include <support/temp_dir_scope.hpp>
#include <watchman/daemon/client/daemon_client.h>
#include <watchman/daemon/daemon.h>

namespace watchman::test {

class DaemonHarness {
public:
    DaemonHarness() : dir_(test_support::TempDirScope::unique_under("wm-it")) {
        sock_ = dir_.path() / "sock";
        log_ = dir_.path() / "watchmand.log";
        // Empty config so a user's own config file never leaks into tests
        config_ = dir_.write("config.toml");
    }

    ~DaemonHarness() { stop(); }

    DaemonHarness(const DaemonHarness&) = delete;
    DaemonHarness& operator=(const DaemonHarness&) = delete;

    // Adjust the daemon config before start().
    void configure(std::function<void(daemon::DaemonConfig&)> fn) { tweak_ = std::move(fn); }

    // Register extra commands before start().
    void withRegistry(std::function<void(CommandRegistry&)> fn) { registryTweak_ = std::move(fn); }

    bool start(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        daemon::DaemonConfig cfg;
        cfg.socketPath = sock_;
        cfg.logFile = log_;
        cfg.workerThreads = 2;
        cfg.configFilePath = config_;
        if (tweak_) {
            tweak_(cfg);
        }
        daemon_ = std::make_unique<daemon::WatchmanDaemon>(cfg);
        if (registryTweak_) {
            registerBuiltinCommands(daemon_->registry());
            registryTweak_(daemon_->registry());
        }

        auto s = daemon_->start();
        if (!s) {
            spdlog::error("[DaemonHarness] start failed: {}", s.error().message);
            daemon_.reset();
            return false;
        }
        runLoopThread_ = std::thread([this]() { daemon_->runLoop(); });

        // Ready once a real round trip succeeds
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            daemon::DaemonClient client(daemon::ClientConfig{sock_, std::chrono::milliseconds(200),
                                                             std::chrono::milliseconds(500)});
            auto r = client.call(nlohmann::json::array({"get-pid"}));
            if (r) {
                return true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
        spdlog::error("[DaemonHarness] daemon did not answer within {}ms", timeout.count());
        return false;
    }

    void stop() {
        if (!daemon_) {
            return;
        }
        daemon_->requestStop();
        if (runLoopThread_.joinable()) {
            runLoopThread_.join();
        }
        auto r = daemon_->stop();
        if (!r) {
            spdlog::warn("[DaemonHarness] stop: {}", r.error().message);
        }
        daemon_.reset();
    }

    daemon::WatchmanDaemon* daemon() const { return daemon_.get(); }
    const std::filesystem::path& socketPath() const { return sock_; }
    const std::filesystem::path& configPath() const { return config_; }

private:
    test_support::TempDirScope dir_;
    std::filesystem::path sock_;
    std::filesystem::path log_;
    std::filesystem::path config_;
    std::function<void(daemon::DaemonConfig&)> tweak_;
    std::function<void(CommandRegistry&)> registryTweak_;
    std::unique_ptr<daemon::WatchmanDaemon> daemon_;
    std::thread runLoopThread_;
};

} // namespace watchman::test
