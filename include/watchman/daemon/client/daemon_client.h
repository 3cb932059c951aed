#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <watchman/core/types.h>
#include <watchman/protocol/pdu.h>

namespace watchman::daemon {

struct ClientConfig {
    std::filesystem::path socketPath;
    std::chrono::milliseconds connectTimeout{1000};
    std::chrono::milliseconds requestTimeout{60000};
    size_t maxPduBytes = protocol::kDefaultMaxPduBytes;
};

// One response PDU exactly as the service wrote it.
struct RawResponse {
    protocol::PduType type = protocol::PduType::Json;
    std::string bytes;
};

/**
 * Synchronous request/response client for the service socket.
 *
 * Each call opens a connection, writes one PDU, reads one PDU and closes.
 * Transport failures come back as Error values whose message carries the
 * "[ipc:<kind>]" classification (see ipc_failure.h).
 */
class DaemonClient {
public:
    explicit DaemonClient(ClientConfig config);

    // Send an already encoded request PDU and return the raw response PDU.
    Result<RawResponse> exchange(std::string requestPdu);

    // Encode, exchange and decode.
    Result<nlohmann::json> call(const nlohmann::json& request,
                                protocol::PduType encoding = protocol::PduType::Json);

    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
};

} // namespace watchman::daemon
