#include <watchman/daemon/client/daemon_client.h>
#include <watchman/daemon/client/ipc_failure.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <memory>
#include <optional>

#ifndef _WIN32
#include <sys/stat.h>
#endif

namespace watchman::daemon {

using boost::asio::awaitable;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using Socket = boost::asio::local::stream_protocol::socket;

namespace {

// Closes the socket when it fires so the pending operation completes with
// operation_aborted; the coroutine then reports a timeout.
class Watchdog {
public:
    Watchdog(const boost::asio::any_io_executor& ex, std::shared_ptr<Socket> socket)
        : socket_(std::move(socket)), timer_(ex) {}

    ~Watchdog() { disarm(); }

    void arm(std::chrono::milliseconds timeout) {
        timer_.expires_after(timeout);
        timer_.async_wait([socket = socket_, fired = fired_](const boost::system::error_code& ec) {
            if (ec) {
                return;
            }
            *fired = true;
            boost::system::error_code ignored;
            socket->close(ignored);
        });
    }

    void disarm() { timer_.cancel(); }

    bool fired() const { return *fired_; }

private:
    std::shared_ptr<Socket> socket_;
    std::shared_ptr<bool> fired_ = std::make_shared<bool>(false);
    boost::asio::steady_timer timer_;
};

IpcFailureKind classifyIoError(const boost::system::error_code& ec) {
    if (ec == boost::asio::error::eof) {
        return IpcFailureKind::Eof;
    }
    if (ec == boost::asio::error::connection_reset || ec == boost::asio::error::broken_pipe ||
        ec == boost::system::errc::connection_reset || ec == boost::system::errc::broken_pipe) {
        return IpcFailureKind::ResetOrBrokenPipe;
    }
    if (ec == boost::asio::error::connection_refused ||
        ec == boost::system::errc::connection_refused) {
        return IpcFailureKind::Refused;
    }
    if (ec == boost::system::errc::no_such_file_or_directory) {
        return IpcFailureKind::SocketMissing;
    }
    if (ec == boost::system::errc::timed_out) {
        return IpcFailureKind::Timeout;
    }
    return IpcFailureKind::Other;
}

Result<void> preflight(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return makeIpcError(IpcFailureKind::SocketMissing,
                            fmt::format("socket not found at '{}'", path.string()));
    }
#ifndef _WIN32
    struct stat st;
    if (::stat(path.c_str(), &st) == 0 && !S_ISSOCK(st.st_mode)) {
        return makeIpcError(IpcFailureKind::PathNotSocket,
                            fmt::format("path exists but is not a socket: '{}'", path.string()));
    }
#endif
    return {};
}

awaitable<Result<RawResponse>> exchangeAsync(const ClientConfig& config, std::string request) {
    auto ex = co_await boost::asio::this_coro::executor;
    auto socket = std::make_shared<Socket>(ex);
    Watchdog watchdog(ex, socket);
    boost::system::error_code ec;
    const auto path = config.socketPath.string();

    watchdog.arm(config.connectTimeout);
    co_await socket->async_connect(boost::asio::local::stream_protocol::endpoint(path),
                                   redirect_error(use_awaitable, ec));
    if (watchdog.fired()) {
        co_return makeIpcError(IpcFailureKind::Timeout,
                               fmt::format("connect timed out after {}ms (socket='{}')",
                                           config.connectTimeout.count(), path));
    }
    if (ec) {
        co_return makeIpcError(classifyIoError(ec),
                               fmt::format("connect failed: {} (socket='{}')", ec.message(), path));
    }

    watchdog.arm(config.requestTimeout);
    co_await boost::asio::async_write(*socket, boost::asio::buffer(request),
                                      redirect_error(use_awaitable, ec));
    if (watchdog.fired()) {
        co_return makeIpcError(IpcFailureKind::Timeout,
                               fmt::format("request timed out after {}ms",
                                           config.requestTimeout.count()));
    }
    if (ec) {
        co_return makeIpcError(classifyIoError(ec), fmt::format("write failed: {}", ec.message()));
    }

    protocol::PduReader reader(config.maxPduBytes);
    std::array<char, 16 * 1024> buf{};
    for (;;) {
        auto next = reader.next();
        if (!next) {
            co_return makeIpcError(IpcFailureKind::Other,
                                   fmt::format("invalid response: {}", next.error().message));
        }
        if (next.value()) {
            auto frame = std::move(*std::move(next).value());
            co_return RawResponse{frame.type, std::move(frame.bytes)};
        }

        std::size_t n = co_await socket->async_read_some(boost::asio::buffer(buf),
                                                         redirect_error(use_awaitable, ec));
        if (watchdog.fired()) {
            co_return makeIpcError(IpcFailureKind::Timeout,
                                   fmt::format("no response within {}ms",
                                               config.requestTimeout.count()));
        }
        if (ec) {
            auto kind = classifyIoError(ec);
            if (kind == IpcFailureKind::Eof) {
                const auto got = reader.buffered() == 0
                                     ? std::string("none")
                                     : fmt::format("{} bytes", reader.buffered());
                co_return makeIpcError(
                    kind, fmt::format("connection closed after {} of a response", got));
            }
            co_return makeIpcError(kind, fmt::format("read failed: {}", ec.message()));
        }
        reader.append(std::string_view(buf.data(), n));
    }
}

} // namespace

DaemonClient::DaemonClient(ClientConfig config) : config_(std::move(config)) {}

Result<RawResponse> DaemonClient::exchange(std::string requestPdu) {
    if (auto pre = preflight(config_.socketPath); !pre) {
        spdlog::debug("DaemonClient preflight: {}", pre.error().message);
        return pre.error();
    }

    boost::asio::io_context io;
    std::optional<Result<RawResponse>> out;
    boost::asio::co_spawn(
        io,
        [&]() -> awaitable<void> {
            try {
                out.emplace(co_await exchangeAsync(config_, std::move(requestPdu)));
            } catch (const std::exception& e) {
                out.emplace(makeIpcError(IpcFailureKind::Other, e.what()));
            }
            co_return;
        },
        boost::asio::detached);

    // The watchdogs bound each phase; this only guards against a stuck loop.
    io.run_for(config_.connectTimeout + config_.requestTimeout + std::chrono::seconds(1));
    if (!out) {
        return makeIpcError(IpcFailureKind::Timeout, "request did not complete");
    }
    return std::move(*out);
}

Result<nlohmann::json> DaemonClient::call(const nlohmann::json& request,
                                          protocol::PduType encoding) {
    auto pdu = protocol::encodePdu(request, encoding);
    if (!pdu) {
        return pdu.error();
    }
    auto raw = exchange(std::move(pdu).value());
    if (!raw) {
        return raw.error();
    }
    auto decoded = protocol::decodePdu(raw.value().bytes, raw.value().type);
    if (!decoded) {
        return makeIpcError(IpcFailureKind::Other,
                            fmt::format("invalid response: {}", decoded.error().message));
    }
    return decoded;
}

} // namespace watchman::daemon
