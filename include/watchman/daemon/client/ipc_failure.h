#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <watchman/core/types.h>

namespace watchman::daemon {

// Stable classification for client-side IPC (AF_UNIX) failures.
//
// The kind travels as a "[ipc:<kind>] " prefix of Error.message so it passes
// through Result/Error unchanged and stays distinct from response-level errors.
enum class IpcFailureKind { SocketMissing, PathNotSocket, Refused, Timeout, ResetOrBrokenPipe, Eof, Other };

inline constexpr std::string_view kIpcFailurePrefix = "[ipc:";

inline constexpr std::string_view to_string(IpcFailureKind k) {
    switch (k) {
        case IpcFailureKind::SocketMissing:
            return "socket_missing";
        case IpcFailureKind::PathNotSocket:
            return "path_not_socket";
        case IpcFailureKind::Refused:
            return "refused";
        case IpcFailureKind::Timeout:
            return "timeout";
        case IpcFailureKind::ResetOrBrokenPipe:
            return "reset_or_broken_pipe";
        case IpcFailureKind::Eof:
            return "eof";
        case IpcFailureKind::Other:
            return "other";
    }
    return "other";
}

inline std::string formatIpcFailure(IpcFailureKind kind, std::string_view detail) {
    std::string out;
    out.reserve(kIpcFailurePrefix.size() + 24 + 2 + detail.size());
    out.append(kIpcFailurePrefix);
    out.append(to_string(kind));
    out.push_back(']');
    out.push_back(' ');
    out.append(detail);
    return out;
}

inline std::optional<IpcFailureKind> parseIpcFailureKind(std::string_view message) {
    if (!message.starts_with(kIpcFailurePrefix)) {
        return std::nullopt;
    }
    auto close = message.find(']');
    auto kindStart = kIpcFailurePrefix.size();
    if (close == std::string_view::npos || close <= kindStart) {
        return std::nullopt;
    }
    // message looks like: [ipc:<kind>] ...
    auto kind = message.substr(kindStart, close - kindStart);
    for (auto k : {IpcFailureKind::SocketMissing, IpcFailureKind::PathNotSocket,
                   IpcFailureKind::Refused, IpcFailureKind::Timeout,
                   IpcFailureKind::ResetOrBrokenPipe, IpcFailureKind::Eof,
                   IpcFailureKind::Other}) {
        if (kind == to_string(k)) {
            return k;
        }
    }
    return std::nullopt;
}

// Timeouts keep their own error code so callers can tell them from hard
// transport faults without parsing the message.
inline Error makeIpcError(IpcFailureKind kind, std::string_view detail) {
    return Error{kind == IpcFailureKind::Timeout ? ErrorCode::Timeout : ErrorCode::NetworkError,
                 formatIpcFailure(kind, detail)};
}

} // namespace watchman::daemon
