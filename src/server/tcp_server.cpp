#include "tcp_server.hpp"

#include "gatekv/logger.hpp"

#include <stdexcept>     // std::runtime_error
#include <sys/socket.h>  // socket(), bind(), listen(), accept4()
#include <netdb.h>       // getaddrinfo() for numeric v4/v6 hosts
#include <poll.h>
#include <unistd.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <string>
#include <utility>

namespace gatekv {

TcpServer::TcpServer(ServerConfig config)
    : config_(std::move(config)),
      admission_(config_.max_per_address, config_.max_total) {}

TcpServer::~TcpServer() {
    TcpServer* self = this;
    s_signal_target.compare_exchange_strong(self, nullptr);
    stop();
    shutdown();
}

void TcpServer::start() {
    if (started_)
        throw std::runtime_error("Server already started");

    bind_and_listen();

    std::signal(SIGPIPE, SIG_IGN); // ignore SIGPIPE
    started_ = true;
    running_ = true;
    setup_workers();

    GATEKV_LOG_INFO << "Listening on " << config_.host << " port " << bound_port_
                    << " (max " << config_.max_per_address << " per address, "
                    << config_.max_total << " total)";
}

void TcpServer::bind_and_listen() {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST | AI_NUMERICSERV;

    addrinfo* results = nullptr;
    std::string service = std::to_string(config_.port);
    int rc = ::getaddrinfo(config_.host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0)
        throw std::runtime_error("Invalid listen address " + config_.host + ": " + ::gai_strerror(rc));

    std::string last_error = "no usable address";
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        Socket candidate{::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol)};
        if (!candidate.valid()) {
            last_error = std::string{"socket: "} + std::strerror(errno);
            continue;
        }

        int opt = 1;
        if (::setsockopt(candidate.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) == -1) {
            GATEKV_LOG_WARN << "SO_REUSEADDR failed: " << std::strerror(errno);
        }

        if (::bind(candidate.fd(), ai->ai_addr, ai->ai_addrlen) == -1) {
            last_error = std::string{"bind: "} + std::strerror(errno);
            continue;
        }
        if (::listen(candidate.fd(), SOMAXCONN) == -1) {
            last_error = std::string{"listen: "} + std::strerror(errno);
            continue;
        }

        listen_socket_ = std::move(candidate);
        break;
    }
    ::freeaddrinfo(results);

    if (!listen_socket_.valid())
        throw std::runtime_error("Failed to listen on " + config_.host + ":" + service + " (" + last_error + ")");

    bound_port_ = listen_socket_.local_port();
}

void TcpServer::serve() {
    pollfd fds[2] = {
        {listen_socket_.fd(), POLLIN, 0},
        {waker_.read_fd(), POLLIN, 0},
    };

    while (running_) {
        int activity = ::poll(fds, 2, -1); // Block until a FD is ready
        if (activity < 0) {
            if (errno == EINTR) // interrupted syscall, eg: SIGWINCH or SIGCONT
                continue;
            GATEKV_LOG_ERROR << "poll failed: " << std::strerror(errno);
            break;
        }

        // stop() poke; the waker stays readable so the handlers see it too
        if (fds[1].revents & POLLIN)
            break;

        if (fds[0].revents & POLLIN)
            handle_new_connections();
    }

    running_ = false;
    shutdown();
    GATEKV_LOG_INFO << "Server stopped";
}

void TcpServer::handle_new_connections() {
    // drain the backlog, accept4 returns nullopt once it is empty
    while (auto client = accept()) {
        auto peer = client->peer_address();
        if (!peer) {
            GATEKV_LOG_WARN << "Dropping connection with unknown peer [fd " << client->fd() << "]";
            continue;
        }

        auto slot = admission_.try_acquire(*peer);
        if (!slot) {
            // client goes out of scope here and the socket is closed
            GATEKV_LOG_INFO << "Refused connection from " << *peer;
            continue;
        }

        GATEKV_LOG_INFO << "Accepted " << *peer << " [fd " << client->fd() << "] ("
                        << admission_.active_total() << "/" << admission_.max_total() << ")";
        sessions_.push_back(Session{std::move(*slot), Connection{std::move(*client), *peer}});
    }
}

std::optional<Socket> TcpServer::accept() {
    while (true) {
        int client_fd = ::accept4(listen_socket_.fd(), nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
        if (client_fd >= 0)
            return Socket{client_fd};

        switch (errno) {
            case EINTR:
                continue;
            case EAGAIN:
#if EAGAIN != EWOULDBLOCK
            case EWOULDBLOCK:
#endif
                return std::nullopt;
            case EBADF:
            case EINVAL:
            case ENOTSOCK:
                throw std::runtime_error(std::string{"Accept failed: "} + std::strerror(errno));
            default:
                // ECONNABORTED, EMFILE, ENOBUFS...: this attempt is lost, the listener is fine
                GATEKV_LOG_WARN << "accept: " << std::strerror(errno);
                return std::nullopt;
        }
    }
}

void TcpServer::stop() noexcept {
    running_ = false;
    waker_.notify();
}

bool TcpServer::is_running() const noexcept {
    return running_;
}

void TcpServer::install_signal_handlers() {
    s_signal_target = this;
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void TcpServer::signal_handler(int) {
    int saved_errno = errno;
    if (TcpServer* server = s_signal_target.load())
        server->stop();
    errno = saved_errno;
}

void TcpServer::shutdown() {
    workers_.clear(); // jthread requests stop and joins

    // sessions nobody picked up; dropping them closes the sockets and frees the slots
    auto leftover = sessions_.drain();
    if (!leftover.empty()) {
        GATEKV_LOG_INFO << "Closing " << leftover.size() << " queued connection(s)";
    }

    listen_socket_ = Socket{};
}

void TcpServer::worker_loop(std::stop_token stop_token) {
    while (!stop_token.stop_requested()) {
        auto session = sessions_.wait_and_pop_front(stop_token);
        if (!session)
            continue;

        ConnectionHandler handler{store_, waker_.read_fd()};
        try {
            handler.serve(std::move(*session));
        } catch (const std::exception& e) {
            // slot is already back with the controller; keep the worker alive
            GATEKV_LOG_ERROR << "Connection handler failed: " << e.what();
        }
    }
}

void TcpServer::setup_workers() {
    workers_.reserve(config_.max_total);
    for (size_t i = 0; i < config_.max_total; i++) {
        workers_.emplace_back([this](std::stop_token stop_token) {
            worker_loop(stop_token);
        });
    }
}

} // namespace gatekv
