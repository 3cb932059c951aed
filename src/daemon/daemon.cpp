#include <watchman/config/config_helpers.h>
#include <watchman/daemon/components/RequestDispatcher.h>
#include <watchman/daemon/components/SocketServer.h>
#include <watchman/daemon/daemon.h>
#include <watchman/version.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <fstream>
#include <stdexcept>

#ifndef _WIN32
#include <unistd.h>
#endif
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace watchman::daemon {

namespace {

void set_current_thread_name(const std::string& name) {
#ifdef __linux__
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#elif __APPLE__
    pthread_setname_np(name.c_str());
#endif
}

Result<size_t> parseSize(const std::string& key, const std::string& raw) {
    auto v = config::parse_int(raw);
    if (!v || *v <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("[daemon] {} must be a positive integer (got '{}')", key, raw)};
    }
    return static_cast<size_t>(*v);
}

} // namespace

Result<void> applyConfigFile(const std::filesystem::path& file, DaemonConfig& config,
                             bool workersFromCli, bool logLevelFromCli) {
    if (file.empty() || !std::filesystem::exists(file)) {
        return {};
    }
    auto values = config::parse_simple_toml(file);
    auto get = [&](const char* key) -> const std::string* {
        auto it = values.find(std::string("daemon.") + key);
        return it == values.end() ? nullptr : &it->second;
    };

    if (const auto* v = get("socket_path"); v && config.socketPath.empty() && !v->empty()) {
        config.socketPath = config::expand_tilde(*v);
    }
    if (const auto* v = get("log_file"); v && config.logFile.empty() && !v->empty()) {
        config.logFile = config::expand_tilde(*v);
    }
    if (const auto* v = get("log_level"); v && !logLevelFromCli && !v->empty()) {
        config.logLevel = *v;
    }
    if (const auto* v = get("worker_threads"); v && !workersFromCli) {
        auto n = parseSize("worker_threads", *v);
        if (!n) {
            return n.error();
        }
        config.workerThreads = n.value();
    }
    if (const auto* v = get("max_pdu_bytes")) {
        auto n = parseSize("max_pdu_bytes", *v);
        if (!n) {
            return n.error();
        }
        config.maxPduBytes = n.value();
    }
    config.configFilePath = file;
    return {};
}

WatchmanDaemon::WatchmanDaemon(const DaemonConfig& config) : config_(config) {
    if (config_.socketPath.empty()) {
        config_.socketPath = resolveSystemPath(PathType::Socket);
    }
}

WatchmanDaemon::~WatchmanDaemon() {
    if (running_.load()) {
        auto r = stop();
        if (!r) {
            spdlog::warn("Daemon stop during destruction failed: {}", r.error().message);
        }
    }
}

Result<void> WatchmanDaemon::start() {
    if (running_.load()) {
        return Error{ErrorCode::InvalidState, "Daemon already running"};
    }
    stopRequested_.store(false);
    state_.stats.startTime = std::chrono::steady_clock::now();

    spdlog::info("Starting watchman daemon {} (socket {})", kVersionString,
                 config_.socketPath.string());

    if (!registry_.lookup("version")) {
        try {
            registerBuiltinCommands(registry_);
        } catch (const std::logic_error& e) {
            return Error{ErrorCode::InternalError,
                         fmt::format("failed to register builtin commands: {}", e.what())};
        }
    }
    state_.readiness.registryReady.store(true);

    std::filesystem::path socketPath = config_.socketPath;
    if (!socketPath.is_absolute()) {
        std::error_code ec;
        auto abs = std::filesystem::absolute(socketPath, ec);
        if (!ec) {
            socketPath = abs;
        }
    }

    CommandContext baseContext;
    baseContext.socketPath = socketPath;
    baseContext.pid = static_cast<long>(::getpid());
    baseContext.registry = &registry_;
    requestDispatcher_ =
        std::make_unique<RequestDispatcher>(&registry_, &state_, std::move(baseContext));

    SocketServer::Config serverConfig;
    serverConfig.socketPath = socketPath;
    serverConfig.workerThreads = config_.workerThreads;
    serverConfig.maxConnections = config_.maxConnections;
    serverConfig.maxPduBytes = config_.maxPduBytes;
    socketServer_ =
        std::make_unique<SocketServer>(serverConfig, requestDispatcher_.get(), &state_);

    auto started = socketServer_->start();
    if (!started) {
        spdlog::error("Failed to start socket server: {}", started.error().message);
        socketServer_.reset();
        requestDispatcher_.reset();
        return started;
    }

    running_.store(true);
    spdlog::info("Daemon ready with {} commands", registry_.size());
    return {};
}

Result<void> WatchmanDaemon::stop() {
    if (!running_.load()) {
        return Error{ErrorCode::InvalidState, "Daemon not running"};
    }
    requestStop();

    Result<void> result;
    if (socketServer_) {
        auto r = socketServer_->stop();
        if (!r && r.error().code != ErrorCode::InvalidState) {
            result = r;
        }
        socketServer_.reset();
    }
    requestDispatcher_.reset();
    running_.store(false);

    auto& stats = state_.stats;
    auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::steady_clock::now() - stats.startTime);
    spdlog::info("Daemon stopped after {}s (connections={} requests={} validation_failures={} "
                 "protocol_errors={})",
                 uptime.count(), stats.totalConnections.load(), stats.requestsProcessed.load(),
                 stats.validationFailures.load(), stats.protocolErrors.load());
    return result;
}

void WatchmanDaemon::runLoop() {
    set_current_thread_name("watchman-main");

    while (!stopRequested_.load()) {
        if (signalCheckHook_ && signalCheckHook_()) {
            spdlog::info("runLoop: shutdown signal received");
            break;
        }
        std::unique_lock<std::mutex> lock(stop_mutex_);
        if (stop_cv_.wait_for(lock, config_.tickInterval,
                              [&] { return stopRequested_.load(); })) {
            break;
        }
    }
    spdlog::debug("runLoop: exiting");
}

std::filesystem::path WatchmanDaemon::resolveSystemPath(PathType type) {
    namespace fs = std::filesystem;
    switch (type) {
        case PathType::Socket:
            return config::default_socket_path();
        case PathType::LogFile: {
            auto logDir = config::get_state_dir();
            std::error_code ec;
            fs::create_directories(logDir, ec);
            if (canWriteToDirectory(logDir)) {
                return logDir / "watchmand.log";
            }
            return config::get_runtime_dir() / "watchmand.log";
        }
    }
    return fs::path();
}

bool WatchmanDaemon::canWriteToDirectory(const std::filesystem::path& dir) {
    namespace fs = std::filesystem;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return false;
    }
    auto testFile = dir / (".watchman-test-" + std::to_string(::getpid()));
    std::ofstream test(testFile);
    if (test.good()) {
        test.close();
        fs::remove(testFile, ec);
        return true;
    }
    return false;
}

} // namespace watchman::daemon
