#pragma once

#include <boost/asio/awaitable.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <watchman/core/types.h>
#include <watchman/protocol/pdu.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace watchman::daemon {

class RequestDispatcher;
struct StateComponent;

/**
 * Unix domain socket server built on Boost.ASIO's local::stream_protocol.
 *
 * One coroutine accepts connections; each connection runs in its own
 * coroutine that splits the byte stream into PDUs, dispatches them in order
 * and writes each response in the encoding of its request.
 */
class SocketServer {
public:
    struct Config {
        std::filesystem::path socketPath;
        size_t maxConnections = 1024;
        size_t workerThreads = 1;
        size_t maxPduBytes = protocol::kDefaultMaxPduBytes;
        std::chrono::milliseconds acceptBackoffMs{100};
    };

    SocketServer(const Config& config, RequestDispatcher* dispatcher, StateComponent* state);
    ~SocketServer();

    SocketServer(const SocketServer&) = delete;
    SocketServer& operator=(const SocketServer&) = delete;

    // Lifecycle
    Result<void> start();
    Result<void> stop();
    bool isRunning() const { return running_.load(); }

    // Absolute path the acceptor is bound to (empty when stopped).
    std::filesystem::path socketPath() const;

private:
    using Socket = boost::asio::local::stream_protocol::socket;

    boost::asio::awaitable<void> accept_loop();
    boost::asio::awaitable<void> handle_connection(std::shared_ptr<Socket> socket);

    // Register active socket for deterministic shutdown
    void register_socket(std::weak_ptr<Socket> socket);
    // Run fn on the io_context and wait for it (bounded) so socket objects are
    // only touched from their executor.
    void execute_on_io_context(std::function<void()> fn);

    Config config_;
    RequestDispatcher* dispatcher_;
    StateComponent* state_;

    // Pending connection frames are destroyed with io_context_ and touch these
    // from their cleanup, so they must outlive it.
    std::atomic<size_t> activeConnections_{0};
    std::atomic<uint64_t> totalConnections_{0};

    boost::asio::io_context io_context_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
        work_guard_;
    std::vector<std::thread> workers_;
    std::unique_ptr<boost::asio::local::stream_protocol::acceptor> acceptor_;

    std::filesystem::path actualSocketPath_;
    mutable std::mutex pathMutex_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};

    std::mutex activeSocketsMutex_;
    std::vector<std::weak_ptr<Socket>> activeSockets_;
};

} // namespace watchman::daemon
