#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>
#include <watchman/core/types.h>

namespace watchman {

inline constexpr std::string_view kCommandValidationError = "watchman::CommandValidationError";

// Mode mask for a command: where it may be executed.
enum class CommandFlags : std::uint32_t {
    None = 0,
    Daemon = 1u << 0,
    Client = 1u << 1,
};

constexpr CommandFlags operator|(CommandFlags a, CommandFlags b) {
    return static_cast<CommandFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

constexpr bool hasFlag(CommandFlags set, CommandFlags flag) {
    return (static_cast<std::uint32_t>(set) & static_cast<std::uint32_t>(flag)) != 0;
}

class CommandRegistry;

struct CommandContext {
    std::filesystem::path socketPath;
    long pid = 0;
    const CommandRegistry* registry = nullptr;
};

// Handlers receive the whole request array (name included) and return the
// fields to merge into the response envelope.
using CommandHandler =
    std::function<Result<nlohmann::json>(CommandContext&, const nlohmann::json& args)>;

struct CommandDefinition {
    std::string name;
    std::string description;
    CommandFlags flags = CommandFlags::Daemon;
    CommandHandler handler;
};

// "watchman::CommandValidationError: failed to validate command: <detail>"
Error makeCommandValidationError(std::string_view detail);

/**
 * Known commands keyed by exact, case-sensitive name.
 *
 * Populated once at startup and only read afterwards, so lookups and
 * validation are safe from any number of connections without locking.
 */
class CommandRegistry {
public:
    Result<void> registerCommand(CommandDefinition def);

    const CommandDefinition* lookup(std::string_view name) const;

    /**
     * Check a decoded request against the registry.
     *
     * The request must be a non-empty array whose first element names a command
     * registered for @p mode. On failure the error code is
     * ErrorCode::ValidationError and the message is the full client-facing text.
     */
    Result<const CommandDefinition*> validate(const nlohmann::json& request,
                                              CommandFlags mode) const;

    // Sorted: "cmd-<name>" for each command plus the static protocol capabilities.
    std::vector<std::string> capabilities() const;
    bool hasCapability(std::string_view capability) const;

    std::size_t size() const { return commands_.size(); }

private:
    std::map<std::string, CommandDefinition, std::less<>> commands_;
};

// Run a validated command and build its response envelope. Handler errors
// and exceptions become {"version", "error"} responses.
nlohmann::json runCommand(const CommandDefinition& def, CommandContext& ctx,
                          const nlohmann::json& request);

// version, list-capabilities, get-sockname, get-pid
void registerBuiltinCommands(CommandRegistry& registry);

} // namespace watchman
