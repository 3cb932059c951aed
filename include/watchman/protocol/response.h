#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <watchman/core/types.h>

namespace watchman::protocol {

// Every response object carries the service version.
nlohmann::json makeResponse();

// {"version": ..., "error": message}
nlohmann::json errorResponse(std::string message);
nlohmann::json errorResponse(const Error& error);

inline bool isErrorResponse(const nlohmann::json& response) {
    return response.is_object() && response.contains("error");
}

} // namespace watchman::protocol
