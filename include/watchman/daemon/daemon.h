#pragma once

#include <watchman/command/command_registry.h>
#include <watchman/core/types.h>
#include <watchman/daemon/components/StateComponent.h>
#include <watchman/protocol/pdu.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace watchman::daemon {

class RequestDispatcher;
class SocketServer;

struct DaemonConfig {
    std::filesystem::path socketPath;
    std::filesystem::path logFile;
    std::string logLevel = "info";
    size_t workerThreads = 1;
    size_t maxConnections = 1024;
    size_t maxPduBytes = protocol::kDefaultMaxPduBytes;
    size_t maxLogFiles = 5;
    size_t maxLogSizeMb = 10;
    // Main loop wake-up interval for the signal check hook
    std::chrono::milliseconds tickInterval{100};
    // Path to loaded config file
    std::filesystem::path configFilePath;
};

// Fill unset fields of config from the [daemon] section of a TOML file.
// Fields already set (non-empty paths, non-default values passed by the
// caller's command line) are kept. A missing file is not an error.
Result<void> applyConfigFile(const std::filesystem::path& file, DaemonConfig& config,
                             bool workersFromCli = false, bool logLevelFromCli = false);

class WatchmanDaemon {
public:
    explicit WatchmanDaemon(const DaemonConfig& config = {});
    ~WatchmanDaemon();

    WatchmanDaemon(const WatchmanDaemon&) = delete;
    WatchmanDaemon& operator=(const WatchmanDaemon&) = delete;

    // Lifecycle management
    Result<void> start();
    Result<void> stop();
    /// Run the daemon main loop on the calling thread. Call after start().
    /// Returns when requestStop() is called or the signal check hook fires.
    void runLoop();
    void requestStop() {
        stopRequested_.store(true, std::memory_order_release);
        stop_cv_.notify_all();
    }
    bool isRunning() const { return running_.load(); }
    bool isStopRequested() const { return stopRequested_.load(); }

    // Polled from runLoop(); returning true stops the loop.
    void setSignalCheckHook(std::function<bool()> hook) { signalCheckHook_ = std::move(hook); }

    const StateComponent& getState() const { return state_; }
    const DaemonConfig& getConfig() const { return config_; }

    // Commands may be added before start(); the registry is read-only afterwards.
    CommandRegistry& registry() { return registry_; }

    // Path resolution helpers
    enum class PathType { Socket, LogFile };
    static std::filesystem::path resolveSystemPath(PathType type);
    static bool canWriteToDirectory(const std::filesystem::path& dir);

private:
    DaemonConfig config_;
    StateComponent state_;
    CommandRegistry registry_;
    std::unique_ptr<RequestDispatcher> requestDispatcher_;
    std::unique_ptr<SocketServer> socketServer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopRequested_{false};
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    std::function<bool()> signalCheckHook_;
};

} // namespace watchman::daemon
