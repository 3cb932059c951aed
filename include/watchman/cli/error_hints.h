#pragma once
#include <string>
#include <string_view>
#include <watchman/core/types.h>
#include <watchman/daemon/client/ipc_failure.h>

namespace watchman::cli {

/**
 * Actionable hints for client-side failures.
 */
struct ErrorHint {
    std::string hint;    // Short actionable suggestion
    std::string command; // Suggested command to run (if any)
};

/**
 * Get an actionable hint for a given error.
 *
 * IPC failures are matched on their "[ipc:<kind>]" classification first,
 * then on the error code.
 */
inline ErrorHint getErrorHint(ErrorCode code, std::string_view message) {
    ErrorHint hint;

    if (auto kind = daemon::parseIpcFailureKind(message)) {
        switch (*kind) {
            case daemon::IpcFailureKind::SocketMissing:
            case daemon::IpcFailureKind::Refused:
                hint.hint = "The watchman service is not running on this socket";
                hint.command = "watchmand --sockname <path>";
                return hint;
            case daemon::IpcFailureKind::PathNotSocket:
                hint.hint = "Point --sockname (or $WATCHMAN_SOCK) at the service socket";
                return hint;
            case daemon::IpcFailureKind::Timeout:
                hint.hint = "The service did not answer in time; retry or raise --timeout";
                return hint;
            case daemon::IpcFailureKind::ResetOrBrokenPipe:
            case daemon::IpcFailureKind::Eof:
                hint.hint = "The service closed the connection; check its log file";
                return hint;
            case daemon::IpcFailureKind::Other:
                break;
        }
    }

    switch (code) {
        case ErrorCode::InvalidArgument:
            hint.hint = "Check command syntax";
            hint.command = "watchman --help";
            break;
        case ErrorCode::InvalidData:
            hint.hint = "With -j, stdin must hold one JSON or BSER command array";
            break;
        default:
            break;
    }
    return hint;
}

/**
 * Format an error message with an actionable hint.
 */
inline std::string formatErrorWithHint(ErrorCode code, std::string_view message) {
    auto hint = getErrorHint(code, message);

    std::string result(message);
    if (!hint.hint.empty()) {
        result += "\n  Hint: " + hint.hint;
        if (!hint.command.empty()) {
            result += "\n  Try: " + hint.command;
        }
    }
    return result;
}

} // namespace watchman::cli
