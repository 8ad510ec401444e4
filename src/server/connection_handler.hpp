#pragma once

#include "connection.hpp"
#include "gatekv/admission_controller.hpp"
#include "gatekv/kv_store.hpp"

#include <atomic>

namespace gatekv {

/*
 * An admitted connection together with the admission slot it holds.
 * Members are destroyed in reverse order: the socket closes first,
 * then the slot goes back to the controller.
 */
struct Session {
    AdmissionSlot slot;
    Connection connection;
};

enum class HandlerState {
    Accepted,
    Serving,
    Closed,
};

enum class CloseReason {
    PeerClosed,
    TransportError,
    ProtocolError,
    RequestTooLarge,
    Shutdown,
};

const char* to_string(CloseReason reason) noexcept;

/*
 * Serves the request stream of one connection:
 * read a line, run it against the store, send the reply, repeat.
 * Replies go out in request order.
 *
 * The session is owned by serve(), so its slot is released on every way out,
 * including an exception escaping serve().
 */
class ConnectionHandler {
public:
    // shutdown_fd: becomes readable when the server stops; -1 for none
    ConnectionHandler(KvStore& store, int shutdown_fd) noexcept
        : store_(store), shutdown_fd_(shutdown_fd) {}

    CloseReason serve(Session session);

    HandlerState state() const noexcept { return state_.load(); }

private:
    enum class Wait { Ready, Shutdown };

    CloseReason run(Connection& connection);

    // Blocks until `events` is signalled on the connection or shutdown fires.
    // Throws IOError on a socket error.
    Wait wait_for(const Connection& connection, short events) const;

    // Sends the whole outbox. false if interrupted by shutdown.
    bool flush(Connection& connection) const;

    KvStore& store_;
    int shutdown_fd_;
    std::atomic<HandlerState> state_{HandlerState::Accepted};
};

} // namespace gatekv
