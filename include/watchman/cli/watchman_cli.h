#pragma once

#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <watchman/command/command_registry.h>
#include <watchman/core/types.h>
#include <watchman/protocol/pdu.h>

namespace watchman::cli {

struct CliOptions {
    bool pretty = false;
    bool noPretty = false;
    std::string sockname;
    std::string serverEncoding;
    std::string outputEncoding = "json";
    bool jsonCommand = false;
    std::chrono::milliseconds timeout{0};
    std::string configPath;
    // Command name and arguments, uninterpreted
    std::vector<std::string> command;
};

/**
 * Main CLI application class.
 *
 * Parses the global options, answers client-mode commands locally and sends
 * everything else to the service, relaying its response on the output stream.
 */
class WatchmanCLI {
public:
    WatchmanCLI(std::ostream& out = std::cout, std::ostream& err = std::cerr,
                std::istream& in = std::cin);

    /**
     * Run the CLI with given arguments.
     *
     * Returns 0 whenever a response was written (including one that carries
     * an "error" field) and 1 for transport faults, unreadable -j input and
     * bad options.
     */
    int run(int argc, char* argv[]);

private:
    struct Resolved {
        std::filesystem::path socketPath;
        protocol::PduType serverEncoding = protocol::PduType::Json;
        protocol::PduType outputEncoding = protocol::PduType::Json;
        std::chrono::milliseconds timeout{60000};
    };

    Result<Resolved> resolve(const CliOptions& opts) const;
    Result<nlohmann::json> buildCommand(const CliOptions& opts);
    Result<void> writeResponse(const nlohmann::json& response, const Resolved& resolved);
    Result<void> relay(std::string_view bytes, protocol::PduType type, const Resolved& resolved);
    int fail(const Error& error);

    std::ostream& out_;
    std::ostream& err_;
    std::istream& in_;
    CommandRegistry registry_;
};

} // namespace watchman::cli
