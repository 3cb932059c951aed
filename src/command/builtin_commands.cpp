#include <watchman/command/command_registry.h>
#include <watchman/version.hpp>

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace watchman {

namespace {

Result<nlohmann::json> cmdVersion(CommandContext& ctx, const nlohmann::json& args) {
    nlohmann::json out = nlohmann::json::object();
    out["version"] = kVersionString;
    if (args.size() < 2 || !args[1].is_object()) {
        return out;
    }
    if (!ctx.registry) {
        return Error{ErrorCode::InvalidState, "command registry unavailable"};
    }
    const auto& query = args[1];
    nlohmann::json caps = nlohmann::json::object();
    for (const char* key : {"optional", "required"}) {
        auto it = query.find(key);
        if (it == query.end()) {
            continue;
        }
        if (!it->is_array()) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("version: '{}' must be an array of strings", key)};
        }
        const bool required = std::string_view(key) == "required";
        for (const auto& cap : *it) {
            if (!cap.is_string()) {
                return Error{ErrorCode::InvalidArgument,
                             fmt::format("version: '{}' must be an array of strings", key)};
            }
            const auto& name = cap.get_ref<const std::string&>();
            const bool have = ctx.registry->hasCapability(name);
            caps[name] = have;
            if (required && !have) {
                return Error{
                    ErrorCode::NotSupported,
                    fmt::format("client required capability `{}` is not supported by this server",
                                name)};
            }
        }
    }
    out["capabilities"] = std::move(caps);
    return out;
}

Result<nlohmann::json> cmdListCapabilities(CommandContext& ctx, const nlohmann::json&) {
    if (!ctx.registry) {
        return Error{ErrorCode::InvalidState, "command registry unavailable"};
    }
    nlohmann::json out = nlohmann::json::object();
    out["capabilities"] = ctx.registry->capabilities();
    return out;
}

Result<nlohmann::json> cmdGetSockname(CommandContext& ctx, const nlohmann::json&) {
    nlohmann::json out = nlohmann::json::object();
    out["sockname"] = ctx.socketPath.string();
    out["unix_domain"] = ctx.socketPath.string();
    return out;
}

Result<nlohmann::json> cmdGetPid(CommandContext& ctx, const nlohmann::json&) {
    nlohmann::json out = nlohmann::json::object();
    out["pid"] = ctx.pid;
    return out;
}

void add(CommandRegistry& registry, CommandDefinition def) {
    auto r = registry.registerCommand(std::move(def));
    if (!r) {
        // Only reachable through a programming error in the builtin table.
        throw std::logic_error(r.error().message);
    }
}

} // namespace

void registerBuiltinCommands(CommandRegistry& registry) {
    add(registry, {"version", "report the server version and check capabilities",
                   CommandFlags::Daemon, cmdVersion});
    add(registry, {"list-capabilities", "list the capabilities supported by the server",
                   CommandFlags::Daemon, cmdListCapabilities});
    add(registry, {"get-sockname", "report the socket path",
                   CommandFlags::Daemon | CommandFlags::Client, cmdGetSockname});
    add(registry,
        {"get-pid", "report the server process id", CommandFlags::Daemon, cmdGetPid});
    spdlog::debug("registered {} builtin commands", registry.size());
}

} // namespace watchman
