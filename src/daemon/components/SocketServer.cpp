#include <watchman/daemon/components/RequestDispatcher.h>
#include <watchman/daemon/components/SocketServer.h>
#include <watchman/daemon/components/StateComponent.h>

#include <spdlog/spdlog.h>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <algorithm>
#include <array>
#include <future>
#include <string_view>

#ifndef _WIN32
#include <sys/un.h>
#endif
#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace {
void set_current_thread_name(const std::string& name) {
#ifdef __linux__
    prctl(PR_SET_NAME, name.c_str(), 0, 0, 0);
#elif __APPLE__
    pthread_setname_np(name.c_str());
#endif
}
} // namespace

namespace watchman::daemon {

using boost::asio::awaitable;
using boost::asio::co_spawn;
using boost::asio::detached;
using boost::asio::redirect_error;
using boost::asio::use_awaitable;
using local = boost::asio::local::stream_protocol;

SocketServer::SocketServer(const Config& config, RequestDispatcher* dispatcher,
                           StateComponent* state)
    : config_(config), dispatcher_(dispatcher), state_(state) {}

SocketServer::~SocketServer() {
    if (running_.load()) {
        auto r = stop();
        if (!r) {
            spdlog::warn("SocketServer: stop during destruction failed: {}", r.error().message);
        }
    }
}

std::filesystem::path SocketServer::socketPath() const {
    std::lock_guard<std::mutex> lk(pathMutex_);
    return actualSocketPath_;
}

Result<void> SocketServer::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::InvalidState, "Socket server already running"};
    }
    stopping_.store(false, std::memory_order_relaxed);

    try {
        spdlog::info("Starting socket server on {}", config_.socketPath.string());

        if (config_.workerThreads == 0) {
            config_.workerThreads = 1;
            spdlog::warn("SocketServer: workerThreads was 0; coercing to 1");
        }

        // Normalize to an absolute path so a later chdir("/") does not matter
        std::filesystem::path sockPath = config_.socketPath;
        if (!sockPath.is_absolute()) {
            std::error_code absEc;
            auto abs = std::filesystem::absolute(sockPath, absEc);
            if (!absEc) {
                sockPath = abs;
            }
        }

#ifndef _WIN32
        {
            std::string sp = sockPath.string();
            if (sp.size() >= sizeof(sockaddr_un::sun_path)) {
                running_ = false;
                return Error{
                    ErrorCode::InvalidArgument,
                    std::string("Socket path too long for AF_UNIX (") + std::to_string(sp.size()) +
                        "/" + std::to_string(sizeof(sockaddr_un::sun_path)) + ") : '" + sp + "'"};
            }
        }
#endif

        std::error_code ec;
        std::filesystem::remove(sockPath, ec);
        if (ec && ec != std::errc::no_such_file_or_directory) {
            spdlog::warn("Failed to remove existing socket: {}", ec.message());
        }

        auto parent = sockPath.parent_path();
        if (!parent.empty() && !std::filesystem::exists(parent)) {
            std::filesystem::create_directories(parent);
            std::filesystem::permissions(parent, std::filesystem::perms::owner_all);
        }

        io_context_.restart();
        work_guard_.emplace(io_context_.get_executor());

        acceptor_ = std::make_unique<local::acceptor>(io_context_);
        local::endpoint endpoint(sockPath.string());
        acceptor_->open(endpoint.protocol());
        acceptor_->bind(endpoint);
        acceptor_->listen(boost::asio::socket_base::max_listen_connections);

        std::filesystem::permissions(sockPath, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_write);

        {
            std::lock_guard<std::mutex> lk(pathMutex_);
            actualSocketPath_ = sockPath;
        }

        co_spawn(
            io_context_,
            [this]() -> awaitable<void> {
                co_await accept_loop();
                co_return;
            },
            detached);

        workers_.reserve(config_.workerThreads);
        try {
            for (size_t i = 0; i < config_.workerThreads; ++i) {
                workers_.emplace_back([this, i]() {
                    set_current_thread_name("watchman-ipc-" + std::to_string(i));
                    spdlog::debug("SocketServer: worker {} starting", i);
                    for (;;) {
                        try {
                            io_context_.run();
                            break;
                        } catch (const std::exception& e) {
                            spdlog::error("SocketServer: worker {} exception: {}", i, e.what());
                        }
                    }
                    spdlog::debug("SocketServer: worker {} exiting", i);
                });
            }
        } catch (const std::system_error& e) {
            spdlog::error("Failed to create worker thread, cleaning up {} existing workers",
                          workers_.size());
            running_ = false;
            work_guard_.reset();
            io_context_.stop();
            for (auto& worker : workers_) {
                if (worker.joinable()) {
                    worker.join();
                }
            }
            workers_.clear();
            throw;
        }

        if (state_) {
            state_->readiness.ipcServerReady.store(true);
        }

        spdlog::info("Socket server listening on {} ({} workers)", sockPath.string(),
                     config_.workerThreads);
        return {};

    } catch (const std::exception& e) {
        running_ = false;
        spdlog::error("SocketServer::start exception: {}", e.what());
        return Error{ErrorCode::IOError,
                     fmt::format("Failed to start socket server: {}", e.what())};
    }
}

Result<void> SocketServer::stop() {
    if (!running_.exchange(false)) {
        return Error{ErrorCode::InvalidState, "Socket server not running"};
    }

    spdlog::info("Stopping socket server");
    stopping_.store(true, std::memory_order_relaxed);

    std::vector<std::shared_ptr<Socket>> sockets;
    {
        std::lock_guard<std::mutex> lk(activeSocketsMutex_);
        for (auto& weak_sock : activeSockets_) {
            if (auto sock = weak_sock.lock()) {
                sockets.push_back(std::move(sock));
            }
        }
        activeSockets_.clear();
    }

    execute_on_io_context([this, sockets]() {
        boost::system::error_code ec;
        if (acceptor_ && acceptor_->is_open()) {
            acceptor_->close(ec);
        }
        for (auto& sock : sockets) {
            if (sock && sock->is_open()) {
                sock->close(ec);
            }
        }
    });
    spdlog::debug("Closed {} active connections", sockets.size());
    sockets.clear();

    work_guard_.reset();
    io_context_.stop();

    for (size_t i = 0; i < workers_.size(); ++i) {
        if (workers_[i].joinable()) {
            workers_[i].join();
        }
    }
    workers_.clear();
    acceptor_.reset();

    if (state_) {
        state_->readiness.ipcServerReady.store(false);
    }

    std::filesystem::path path;
    {
        std::lock_guard<std::mutex> lk(pathMutex_);
        path = std::move(actualSocketPath_);
        actualSocketPath_.clear();
    }
    if (!path.empty()) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    spdlog::info("Socket server stopped (total_conn={} active_conn={})",
                 totalConnections_.load(std::memory_order_relaxed),
                 activeConnections_.load(std::memory_order_relaxed));
    stopping_.store(false, std::memory_order_relaxed);
    return {};
}

void SocketServer::execute_on_io_context(std::function<void()> fn) {
    if (workers_.empty() || io_context_.stopped()) {
        fn();
        return;
    }
    auto done = std::make_shared<std::promise<void>>();
    auto fut = done->get_future();
    boost::asio::post(io_context_, [fn = std::move(fn), done]() {
        fn();
        done->set_value();
    });
    if (fut.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        spdlog::warn("SocketServer: timed out waiting for io_context task");
    }
}

void SocketServer::register_socket(std::weak_ptr<Socket> socket) {
    std::lock_guard<std::mutex> lk(activeSocketsMutex_);
    activeSockets_.erase(std::remove_if(activeSockets_.begin(), activeSockets_.end(),
                                        [](const auto& weak) { return weak.expired(); }),
                         activeSockets_.end());
    activeSockets_.push_back(std::move(socket));
}

awaitable<void> SocketServer::accept_loop() {
    spdlog::debug("Accept loop started");

    while (running_ && !stopping_) {
        boost::system::error_code ec;
        auto socket = co_await acceptor_->async_accept(redirect_error(use_awaitable, ec));

        if (ec) {
            if (!running_ || stopping_ || ec == boost::asio::error::operation_aborted) {
                break;
            }
            spdlog::warn("Accept error: {} ({})", ec.message(), ec.value());
            boost::asio::steady_timer timer(io_context_);
            timer.expires_after(config_.acceptBackoffMs);
            boost::system::error_code timerEc;
            co_await timer.async_wait(redirect_error(use_awaitable, timerEc));
            continue;
        }

        if (activeConnections_.load() >= config_.maxConnections) {
            spdlog::warn("SocketServer: connection limit {} reached; closing new connection",
                         config_.maxConnections);
            boost::system::error_code closeEc;
            socket.close(closeEc);
            continue;
        }

        auto current = activeConnections_.fetch_add(1) + 1;
        totalConnections_.fetch_add(1);
        if (state_) {
            state_->stats.totalConnections.fetch_add(1, std::memory_order_relaxed);
        }
        spdlog::debug("SocketServer: accepted connection, active={} total={}", current,
                      totalConnections_.load());

        auto sock = std::make_shared<Socket>(std::move(socket));
        register_socket(sock);
        co_spawn(acceptor_->get_executor(), handle_connection(std::move(sock)), detached);
    }

    spdlog::debug("Accept loop ended");
}

awaitable<void> SocketServer::handle_connection(std::shared_ptr<Socket> socket) {
    struct CleanupGuard {
        SocketServer* server;
        ~CleanupGuard() {
            auto current = server->activeConnections_.fetch_sub(1) - 1;
            spdlog::debug("Connection closed, active: {}", current);
        }
    } guard{this};

    protocol::PduReader reader(config_.maxPduBytes);
    std::array<char, 16 * 1024> buf{};
    boost::system::error_code ec;

    for (;;) {
        // Answer every complete PDU already buffered, in arrival order
        for (;;) {
            auto next = reader.next();
            if (!next) {
                if (state_) {
                    state_->stats.protocolErrors.fetch_add(1, std::memory_order_relaxed);
                }
                spdlog::debug("Closing connection after framing error: {}",
                              next.error().message);
                auto bytes = RequestDispatcher::encodeError(
                    next.error().message, reader.pendingType().value_or(protocol::PduType::Json));
                co_await boost::asio::async_write(*socket, boost::asio::buffer(bytes),
                                                  redirect_error(use_awaitable, ec));
                co_return;
            }
            if (!next.value()) {
                break;
            }

            RequestDispatcher::PduReply reply;
            if (dispatcher_) {
                reply = dispatcher_->dispatchPdu(*next.value());
            } else {
                reply.bytes =
                    RequestDispatcher::encodeError("server is not ready", next.value()->type);
            }
            co_await boost::asio::async_write(*socket, boost::asio::buffer(reply.bytes),
                                              redirect_error(use_awaitable, ec));
            if (ec) {
                spdlog::debug("Connection write failed: {}", ec.message());
                co_return;
            }
            if (reply.closeConnection) {
                boost::system::error_code ignored;
                socket->shutdown(Socket::shutdown_both, ignored);
                co_return;
            }
        }

        std::size_t n =
            co_await socket->async_read_some(boost::asio::buffer(buf), redirect_error(use_awaitable, ec));
        if (ec) {
            if (ec != boost::asio::error::eof && ec != boost::asio::error::operation_aborted) {
                spdlog::debug("Connection read failed: {}", ec.message());
            }
            co_return;
        }
        reader.append(std::string_view(buf.data(), n));
    }
}

} // namespace watchman::daemon
