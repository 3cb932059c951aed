#include <watchman/daemon/components/RequestDispatcher.h>
#include <watchman/daemon/components/StateComponent.h>
#include <watchman/protocol/response.h>

#include <spdlog/spdlog.h>

namespace watchman::daemon {

RequestDispatcher::RequestDispatcher(const CommandRegistry* registry, StateComponent* state,
                                     CommandContext baseContext)
    : registry_(registry), state_(state), baseContext_(std::move(baseContext)) {
    if (!baseContext_.registry) {
        baseContext_.registry = registry_;
    }
}

nlohmann::json RequestDispatcher::dispatch(const nlohmann::json& request) const {
    if (state_) {
        state_->stats.requestsProcessed.fetch_add(1, std::memory_order_relaxed);
    }
    if (!registry_) {
        return protocol::errorResponse(Error{ErrorCode::InvalidState, "no command registry"});
    }

    auto validated = registry_->validate(request, CommandFlags::Daemon);
    if (!validated) {
        if (state_) {
            state_->stats.validationFailures.fetch_add(1, std::memory_order_relaxed);
        }
        return protocol::errorResponse(validated.error());
    }
    const CommandDefinition* def = validated.value();

    CommandContext ctx = baseContext_;
    auto response = runCommand(*def, ctx, request);
    if (state_ && protocol::isErrorResponse(response)) {
        state_->stats.handlerErrors.fetch_add(1, std::memory_order_relaxed);
    }
    return response;
}

std::string RequestDispatcher::encodeError(const std::string& message,
                                           protocol::PduType encoding) {
    auto resp = protocol::errorResponse(message);
    auto encoded = protocol::encodePdu(resp, encoding);
    if (encoded) {
        return std::move(encoded).value();
    }
    return resp.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

RequestDispatcher::PduReply RequestDispatcher::dispatchPdu(
    const protocol::PduReader::Frame& frame) const {
    auto decoded = protocol::decodePdu(frame.bytes, frame.type);
    if (!decoded) {
        spdlog::debug("rejecting malformed {} PDU: {}", protocol::to_string(frame.type),
                      decoded.error().message);
        if (state_) {
            state_->stats.protocolErrors.fetch_add(1, std::memory_order_relaxed);
        }
        return PduReply{encodeError(decoded.error().message, frame.type), true};
    }

    auto response = dispatch(decoded.value());
    auto encoded = protocol::encodePdu(response, frame.type);
    if (!encoded) {
        spdlog::warn("failed to encode response: {}", encoded.error().message);
        return PduReply{encodeError(encoded.error().message, frame.type), false};
    }
    return PduReply{std::move(encoded).value(), false};
}

} // namespace watchman::daemon
