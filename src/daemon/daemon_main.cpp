#include <watchman/config/config_helpers.h>
#include <watchman/daemon/daemon.h>
#include <watchman/version.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
// POSIX headers for daemonization
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>
// Fatal signal/backtrace support
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>
#include <thread>
#if !defined(_WIN32)
#include <execinfo.h>
#endif

namespace {

volatile std::sig_atomic_t g_stop_signal = 0;

void log_fatal(const char* what) {
    try {
        spdlog::critical("FATAL: {}", what);
        spdlog::critical("Aborting after fatal error");
    } catch (const std::exception&) {
        std::fprintf(stderr, "FATAL: %s\n", what);
    }
}

void fatal_signal_handler(int signo) {
    const char* sigstr = (signo == SIGSEGV)   ? "SIGSEGV"
                         : (signo == SIGABRT) ? "SIGABRT"
                                              : "UNKNOWN";
    log_fatal(sigstr);
#if !defined(_WIN32)
    void* bt[64];
    int n = backtrace(bt, 64);
    char** syms = backtrace_symbols(bt, n);
    if (syms) {
        for (int i = 0; i < n; ++i) {
            spdlog::critical("Backtrace[{}]: {}", i, syms[i]);
        }
        free(syms);
    }
#endif
    // Give logger a moment to flush
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::_Exit(128 + signo);
}

void stop_signal_handler(int signo) {
    g_stop_signal = signo;
}

void setup_signal_handlers() {
    std::signal(SIGSEGV, fatal_signal_handler);
    std::signal(SIGABRT, fatal_signal_handler);
    std::signal(SIGTERM, stop_signal_handler);
    std::signal(SIGINT, stop_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);
    std::set_terminate([]() noexcept {
        log_fatal("std::terminate called");
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::_Exit(1);
    });
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    if (name == "trace")
        return spdlog::level::trace;
    if (name == "debug")
        return spdlog::level::debug;
    if (name == "info")
        return spdlog::level::info;
    if (name == "warn" || name == "warning")
        return spdlog::level::warn;
    if (name == "error")
        return spdlog::level::err;
    if (name == "off")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

int main(int argc, char* argv[]) {
    // Install fatal handlers as early as possible
    setup_signal_handlers();

    CLI::App app{"watchmand - watchman command service"};

    watchman::daemon::DaemonConfig config;
    std::string configPath;
    std::string socketPath;
    bool foreground = false;

    app.add_option("--config", configPath, "Configuration file path");
    app.add_option("-U,--sockname", socketPath, "Unix domain socket path");
    app.add_option("--logfile,--log-file", config.logFile, "Log file path");
    auto* workersOpt =
        app.add_option("--workers", config.workerThreads, "Number of IPC worker threads")
            ->check(CLI::PositiveNumber);
    auto* logLevelOpt = app.add_option("--log-level", config.logLevel,
                                       "Log level (trace/debug/info/warn/error/off)");
    app.add_flag("-f,--foreground", foreground, "Run in foreground (don't daemonize)");
    app.set_version_flag("--version", std::string(watchman::kVersionString));

    CLI11_PARSE(app, argc, argv);

    namespace fs = std::filesystem;
    auto configFile = watchman::config::get_config_path(configPath);
    if (!configPath.empty() && !fs::exists(configFile)) {
        std::cerr << "watchmand: config file not found: " << configFile.string() << std::endl;
        return 1;
    }
    if (auto applied = watchman::daemon::applyConfigFile(
            configFile, config, workersOpt->count() > 0, logLevelOpt->count() > 0);
        !applied) {
        std::cerr << "watchmand: " << applied.error().message << std::endl;
        return 1;
    }

    // command line > $WATCHMAN_SOCK > config > default
    config.socketPath = watchman::config::resolve_socket_path(socketPath, configFile, "daemon");
    // Resolved before daemonizing changes the working directory
    if (std::error_code ec; !config.socketPath.is_absolute()) {
        auto abs = fs::absolute(config.socketPath, ec);
        if (!ec) {
            config.socketPath = abs;
        }
    }

    auto level = parse_log_level(config.logLevel);
    if (!level) {
        std::cerr << "watchmand: unknown log level '" << config.logLevel << "'" << std::endl;
        return 1;
    }

    if (config.logFile.empty()) {
        config.logFile = watchman::daemon::WatchmanDaemon::resolveSystemPath(
            watchman::daemon::WatchmanDaemon::PathType::LogFile);
    }

    // Configure logging: stderr in foreground, otherwise a rotating file that
    // survives daemonizing
    try {
        std::shared_ptr<spdlog::logger> logger;
        if (foreground) {
            logger = std::make_shared<spdlog::logger>(
                "watchmand", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
        } else {
            std::error_code ec;
            fs::create_directories(config.logFile.parent_path(), ec);
            const size_t max_size = config.maxLogSizeMb * 1024 * 1024;
            auto rotating_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.logFile.string(), max_size, config.maxLogFiles);
            logger = std::make_shared<spdlog::logger>("watchmand", rotating_sink);
        }
        spdlog::set_default_logger(logger);
        spdlog::set_level(*level);
        spdlog::flush_on(spdlog::level::info);
        if (!foreground) {
            spdlog::info("Log rotation enabled: {} (max {}MB x {} files)",
                         config.logFile.string(), config.maxLogSizeMb, config.maxLogFiles);
        }
    } catch (const spdlog::spdlog_ex& e) {
        std::cerr << "watchmand: failed to open log " << config.logFile.string() << ": "
                  << e.what() << std::endl;
        return 1;
    }

    if (!foreground) {
        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Failed to fork daemon process" << std::endl;
            return 1;
        }
        if (pid > 0) {
            std::cout << "Daemon started with PID: " << pid << std::endl;
            return 0;
        }

        if (setsid() < 0) {
            spdlog::error("Failed to create new session");
            return 1;
        }
        if (chdir("/") < 0) {
            spdlog::error("Failed to change working directory");
            return 1;
        }

        // Close standard file descriptors (file logger remains active)
        close(STDIN_FILENO);
        close(STDOUT_FILENO);
        close(STDERR_FILENO);
        open("/dev/null", O_RDONLY); // stdin
        open("/dev/null", O_RDWR);   // stdout
        open("/dev/null", O_RDWR);   // stderr
    }

    try {
        watchman::daemon::WatchmanDaemon daemon(config);
        daemon.setSignalCheckHook([]() { return g_stop_signal != 0; });

        auto result = daemon.start();
        if (!result) {
            spdlog::error("Failed to start daemon: {}", result.error().message);
            return 1;
        }

        daemon.runLoop();

        if (g_stop_signal != 0) {
            spdlog::info("Received signal {}, shutting down", static_cast<int>(g_stop_signal));
        }
        auto stopped = daemon.stop();
        if (!stopped) {
            spdlog::warn("Daemon stop reported: {}", stopped.error().message);
        }
        spdlog::shutdown();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Daemon error: {}", e.what());
        return 1;
    }
}
