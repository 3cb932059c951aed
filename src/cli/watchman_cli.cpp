#include <watchman/cli/error_hints.h>
#include <watchman/cli/watchman_cli.h>
#include <watchman/config/config_helpers.h>
#include <watchman/daemon/client/daemon_client.h>
#include <watchman/version.hpp>

#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string_view>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace watchman::cli {

WatchmanCLI::WatchmanCLI(std::ostream& out, std::ostream& err, std::istream& in)
    : out_(out), err_(err), in_(in) {
    registerBuiltinCommands(registry_);
}

int WatchmanCLI::run(int argc, char* argv[]) {
    CliOptions opts;
    std::int64_t timeoutMs = 0;

    CLI::App app{"watchman - send a command to the watchman service"};
    app.prefix_command();
    app.add_flag("-p,--pretty", opts.pretty, "Indent JSON output");
    app.add_flag("--no-pretty", opts.noPretty, "Compact JSON output (overrides --pretty)");
    app.add_option("-U,--sockname", opts.sockname, "Service socket path");
    app.add_option("--server-encoding", opts.serverEncoding, "PDU encoding used with the service")
        ->check(CLI::IsMember({"json", "bser"}));
    app.add_option("--output-encoding", opts.outputEncoding, "Encoding written to stdout")
        ->check(CLI::IsMember({"json", "bser"}));
    app.add_flag("-j,--json-command", opts.jsonCommand,
                 "Read the command array (JSON or BSER) from stdin");
    app.add_option("--timeout", timeoutMs, "Request timeout in milliseconds")
        ->check(CLI::PositiveNumber);
    app.add_option("--config", opts.configPath, "Configuration file path");
    app.set_version_flag("--version", std::string(kVersionString));

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        int rc = app.exit(e, out_, err_);
        return rc == 0 ? 0 : 1;
    }
    opts.command = app.remaining();
    opts.timeout = std::chrono::milliseconds(timeoutMs);

    // "--" ends option parsing; whatever follows it is the command verbatim
    bool separated = false;
    for (int i = 1; i < argc; ++i) {
        if (std::string_view(argv[i]) != "--") {
            continue;
        }
        auto after = static_cast<std::size_t>(argc - i - 1);
        if (opts.command.size() == after + 1 && opts.command.front() == "--") {
            opts.command.erase(opts.command.begin());
        }
        separated = opts.command.size() == after;
        break;
    }
    // prefix_command() passes unrecognized options through with the command
    if (!separated && !opts.command.empty() && opts.command.front().size() > 1 &&
        opts.command.front().front() == '-') {
        return fail(Error{ErrorCode::InvalidArgument,
                          fmt::format("unknown option '{}'", opts.command.front())});
    }

    auto resolved = resolve(opts);
    if (!resolved) {
        return fail(resolved.error());
    }

    auto command = buildCommand(opts);
    if (!command) {
        return fail(command.error());
    }
    const auto& request = command.value();

    // Client-mode commands never reach the service
    if (request.is_array() && !request.empty() && request.front().is_string()) {
        const auto* def = registry_.lookup(request.front().get_ref<const std::string&>());
        if (def && hasFlag(def->flags, CommandFlags::Client)) {
            CommandContext ctx;
            ctx.socketPath = resolved.value().socketPath;
            ctx.pid = static_cast<long>(::getpid());
            ctx.registry = &registry_;
            spdlog::debug("answering '{}' locally", def->name);
            auto written = writeResponse(runCommand(*def, ctx, request), resolved.value());
            return written ? 0 : fail(written.error());
        }
    }

    auto pdu = protocol::encodePdu(request, resolved.value().serverEncoding);
    if (!pdu) {
        return fail(pdu.error());
    }

    daemon::ClientConfig clientConfig;
    clientConfig.socketPath = resolved.value().socketPath;
    clientConfig.requestTimeout = resolved.value().timeout;
    clientConfig.connectTimeout = std::min(clientConfig.connectTimeout, resolved.value().timeout);
    daemon::DaemonClient client(clientConfig);

    auto raw = client.exchange(std::move(pdu).value());
    if (!raw) {
        return fail(raw.error());
    }
    auto written = relay(raw.value().bytes, raw.value().type, resolved.value());
    return written ? 0 : fail(written.error());
}

Result<WatchmanCLI::Resolved> WatchmanCLI::resolve(const CliOptions& opts) const {
    Resolved r;
    auto configFile = config::get_config_path(opts.configPath);
    if (!opts.configPath.empty() && !std::filesystem::exists(configFile)) {
        return Error{ErrorCode::FileNotFound,
                     fmt::format("config file not found: {}", configFile.string())};
    }
    auto values = config::parse_simple_toml(configFile);

    r.socketPath = config::resolve_socket_path(opts.sockname, configFile, "client");

    std::string serverEncoding = opts.serverEncoding;
    if (serverEncoding.empty()) {
        auto it = values.find("client.server_encoding");
        serverEncoding = it == values.end() ? "json" : it->second;
    }
    auto server = protocol::parsePduType(serverEncoding);
    if (!server) {
        return server.error();
    }
    r.serverEncoding = server.value();

    auto output = protocol::parsePduType(opts.outputEncoding);
    if (!output) {
        return output.error();
    }
    r.outputEncoding = output.value();
    if (r.outputEncoding == protocol::PduType::Json && opts.pretty && !opts.noPretty) {
        r.outputEncoding = protocol::PduType::PrettyJson;
    }

    if (opts.timeout.count() > 0) {
        r.timeout = opts.timeout;
    } else if (auto it = values.find("client.timeout_ms"); it != values.end()) {
        auto ms = config::parse_int(it->second);
        if (!ms || *ms <= 0) {
            return Error{ErrorCode::InvalidArgument,
                         fmt::format("[client] timeout_ms must be a positive integer (got '{}')",
                                     it->second)};
        }
        r.timeout = std::chrono::milliseconds(*ms);
    }
    return r;
}

Result<nlohmann::json> WatchmanCLI::buildCommand(const CliOptions& opts) {
    if (!opts.jsonCommand) {
        if (opts.command.empty()) {
            return Error{ErrorCode::InvalidArgument, "no command specified"};
        }
        nlohmann::json cmd = nlohmann::json::array();
        for (const auto& arg : opts.command) {
            cmd.push_back(arg);
        }
        return cmd;
    }

    if (!opts.command.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "-j reads the command from stdin; do not also pass it as arguments"};
    }
    std::string input((std::istreambuf_iterator<char>(in_)), std::istreambuf_iterator<char>());
    auto type = protocol::detectPduType(input);
    if (!type) {
        return Error{ErrorCode::InvalidData, "failed to parse command from stdin: no input"};
    }
    auto decoded = protocol::decodePdu(input, *type);
    if (!decoded) {
        return Error{ErrorCode::InvalidData,
                     fmt::format("failed to parse command from stdin: {}",
                                 decoded.error().message)};
    }
    return decoded;
}

Result<void> WatchmanCLI::writeResponse(const nlohmann::json& response,
                                        const Resolved& resolved) {
    auto encoded = protocol::encodePdu(response, resolved.outputEncoding);
    if (!encoded) {
        return encoded.error();
    }
    out_ << encoded.value();
    out_.flush();
    if (!out_) {
        return Error{ErrorCode::IOError, "failed to write response to stdout"};
    }
    return {};
}

Result<void> WatchmanCLI::relay(std::string_view bytes, protocol::PduType type,
                                const Resolved& resolved) {
    if (type == resolved.outputEncoding) {
        out_.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out_.flush();
        if (!out_) {
            return Error{ErrorCode::IOError, "failed to write response to stdout"};
        }
        return {};
    }
    auto decoded = protocol::decodePdu(bytes, type);
    if (!decoded) {
        return daemon::makeIpcError(daemon::IpcFailureKind::Other,
                                    "invalid response: " + decoded.error().message);
    }
    return writeResponse(decoded.value(), resolved);
}

int WatchmanCLI::fail(const Error& error) {
    err_ << "watchman: " << formatErrorWithHint(error.code, error.message) << std::endl;
    return 1;
}

} // namespace watchman::cli
