#include <watchman/protocol/response.h>
#include <watchman/version.hpp>

namespace watchman::protocol {

nlohmann::json makeResponse() {
    nlohmann::json resp = nlohmann::json::object();
    resp["version"] = kVersionString;
    return resp;
}

nlohmann::json errorResponse(std::string message) {
    auto resp = makeResponse();
    resp["error"] = std::move(message);
    return resp;
}

nlohmann::json errorResponse(const Error& error) {
    if (error.message.empty()) {
        return errorResponse(std::string(errorToString(error.code)));
    }
    return errorResponse(error.message);
}

} // namespace watchman::protocol
