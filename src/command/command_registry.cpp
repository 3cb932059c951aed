#include <watchman/command/command_registry.h>
#include <watchman/protocol/response.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace watchman {

namespace {
constexpr std::string_view kStaticCapabilities[] = {"bser-v1"};
} // namespace

Error makeCommandValidationError(std::string_view detail) {
    return Error{ErrorCode::ValidationError,
                 fmt::format("{}: failed to validate command: {}", kCommandValidationError, detail)};
}

Result<void> CommandRegistry::registerCommand(CommandDefinition def) {
    if (def.name.empty()) {
        return Error{ErrorCode::InvalidArgument, "command name must not be empty"};
    }
    if (!def.handler) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("command '{}' has no handler", def.name)};
    }
    if (commands_.find(def.name) != commands_.end()) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("command '{}' is already registered", def.name)};
    }
    auto name = def.name;
    commands_.emplace(std::move(name), std::move(def));
    return {};
}

const CommandDefinition* CommandRegistry::lookup(std::string_view name) const {
    auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : &it->second;
}

Result<const CommandDefinition*> CommandRegistry::validate(const nlohmann::json& request,
                                                           CommandFlags mode) const {
    if (!request.is_array()) {
        return makeCommandValidationError("expected an array");
    }
    if (request.empty()) {
        return makeCommandValidationError(
            "invalid command (expected an array with some elements!)");
    }
    const auto& first = request.front();
    if (!first.is_string()) {
        return makeCommandValidationError("expected first element to be a string");
    }
    const auto& name = first.get_ref<const std::string&>();
    const auto* def = lookup(name);
    if (!def) {
        spdlog::debug("rejecting unknown command '{}'", name);
        return makeCommandValidationError(fmt::format("unknown command {}", name));
    }
    if (!hasFlag(def->flags, mode)) {
        return makeCommandValidationError(
            fmt::format("command {} not available in this mode", name));
    }
    return def;
}

std::vector<std::string> CommandRegistry::capabilities() const {
    std::vector<std::string> caps;
    caps.reserve(commands_.size() + std::size(kStaticCapabilities));
    for (const auto& [name, def] : commands_) {
        caps.push_back("cmd-" + name);
    }
    for (auto cap : kStaticCapabilities) {
        caps.emplace_back(cap);
    }
    std::sort(caps.begin(), caps.end());
    return caps;
}

bool CommandRegistry::hasCapability(std::string_view capability) const {
    if (capability.starts_with("cmd-")) {
        return lookup(capability.substr(4)) != nullptr;
    }
    return std::find(std::begin(kStaticCapabilities), std::end(kStaticCapabilities),
                     capability) != std::end(kStaticCapabilities);
}

nlohmann::json runCommand(const CommandDefinition& def, CommandContext& ctx,
                          const nlohmann::json& request) {
    Result<nlohmann::json> result = Error{ErrorCode::InternalError};
    try {
        result = def.handler(ctx, request);
    } catch (const std::exception& e) {
        spdlog::error("command '{}' threw: {}", def.name, e.what());
        return protocol::errorResponse(std::string("internal error: ") + e.what());
    }
    if (!result) {
        spdlog::debug("command '{}' failed: {}", def.name, result.error().message);
        return protocol::errorResponse(result.error());
    }

    auto response = protocol::makeResponse();
    const auto& fields = result.value();
    if (fields.is_object()) {
        for (auto it = fields.begin(); it != fields.end(); ++it) {
            response[it.key()] = it.value();
        }
    } else if (!fields.is_null()) {
        response["result"] = fields;
    }
    return response;
}

} // namespace watchman
