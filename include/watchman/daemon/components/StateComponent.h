#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace watchman::daemon {

/**
 * @struct DaemonReadiness
 * @brief Readiness flags for the daemon subsystems.
 */
struct DaemonReadiness {
    std::atomic<bool> registryReady{false};
    std::atomic<bool> ipcServerReady{false};

    bool fullyReady() const { return registryReady && ipcServerReady; }
};

/**
 * @struct DaemonStats
 * @brief Runtime counters, updated from connection coroutines.
 */
struct DaemonStats {
    std::chrono::steady_clock::time_point startTime;
    std::atomic<uint64_t> requestsProcessed{0};
    std::atomic<uint64_t> validationFailures{0};
    std::atomic<uint64_t> handlerErrors{0};
    std::atomic<uint64_t> protocolErrors{0};
    std::atomic<uint64_t> totalConnections{0};
};

/**
 * @struct StateComponent
 * @brief Shared state owned by the daemon and read by its components.
 */
struct StateComponent {
    DaemonReadiness readiness;
    DaemonStats stats;
};

} // namespace watchman::daemon
