#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <watchman/command/command_registry.h>
#include <watchman/protocol/pdu.h>

namespace watchman::daemon {

struct StateComponent;

/**
 * Validates decoded requests against the command registry and runs the
 * matching handler.
 *
 * Every outcome is a response object: validation failures, handler errors and
 * handler exceptions all become {"version", "error"} envelopes. Nothing here
 * writes above debug level for a rejected command.
 */
class RequestDispatcher {
public:
    struct PduReply {
        std::string bytes;
        // Set when the request could not be decoded; the connection must close.
        bool closeConnection = false;
    };

    RequestDispatcher(const CommandRegistry* registry, StateComponent* state,
                      CommandContext baseContext);

    nlohmann::json dispatch(const nlohmann::json& request) const;

    // Decode one framed PDU, dispatch it and encode the reply in the same encoding.
    PduReply dispatchPdu(const protocol::PduReader::Frame& frame) const;

    // Encode an error reply in the given encoding (JSON if that fails).
    static std::string encodeError(const std::string& message, protocol::PduType encoding);

private:
    const CommandRegistry* registry_;
    StateComponent* state_;
    CommandContext baseContext_;
};

} // namespace watchman::daemon
