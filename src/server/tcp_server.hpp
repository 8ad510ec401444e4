#pragma once

#include "gatekv/admission_controller.hpp"
#include "gatekv/kv_store.hpp"
#include "gatekv/server_config.hpp"
#include "gatekv/socket.hpp"
#include "gatekv/task_deque.hpp"
#include "connection_handler.hpp"
#include "waker.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

namespace gatekv {

/*
 * Listener plus worker pool.
 *
 * serve() accepts connections and asks the admission controller about each
 * one. Refused sockets are closed on the spot; admitted ones are queued as
 * sessions for the workers, each of which serves one connection at a time.
 * The pool has max_total workers, which is also the most sessions that can
 * be admitted at once.
 */
class TcpServer {
public:
    explicit TcpServer(ServerConfig config);

    // Stops and joins the workers if still running
    ~TcpServer();

    TcpServer(const TcpServer&) = delete;
    TcpServer& operator=(const TcpServer&) = delete;

    TcpServer(TcpServer&&) = delete;
    TcpServer& operator=(TcpServer&&) = delete;

    // Bind, listen and spawn the workers.
    // Throws std::runtime_error on failure.
    void start();

    // Accept loop. Returns after stop(); workers are joined before returning.
    void serve();

    // Async-signal-safe; wakes the listener and every handler
    void stop() noexcept;

    // Route SIGINT / SIGTERM to stop() of this server
    void install_signal_handlers();

    bool is_running() const noexcept;

    // Port actually bound; differs from the config when it asked for 0
    uint16_t port() const noexcept { return bound_port_; }

    KvStore& store() noexcept { return store_; }
    const AdmissionController& admission() const noexcept { return admission_; }

private:
    void bind_and_listen();
    void handle_new_connections();
    std::optional<Socket> accept();

    void setup_workers();
    void worker_loop(std::stop_token stop_token);
    void shutdown();

    ServerConfig config_;
    KvStore store_;
    AdmissionController admission_;
    Waker waker_;
    Socket listen_socket_;
    uint16_t bound_port_{0};
    std::atomic<bool> running_{false};
    bool started_{false};

    // Declared after the controller: queued sessions release into it
    TaskDeque<Session> sessions_;
    // Declared last so workers are joined before anything they use goes away
    std::vector<std::jthread> workers_;

    inline static std::atomic<TcpServer*> s_signal_target{nullptr};
    static void signal_handler(int);
};

} // namespace gatekv
