#include "connection_handler.hpp"

#include "gatekv/command_dispatcher.hpp"
#include "gatekv/logger.hpp"
#include "gatekv/protocol.hpp"

#include <cerrno>
#include <poll.h>

namespace gatekv {

const char* to_string(CloseReason reason) noexcept {
    switch (reason) {
        case CloseReason::PeerClosed:      return "peer closed";
        case CloseReason::TransportError:  return "transport error";
        case CloseReason::ProtocolError:   return "protocol error";
        case CloseReason::RequestTooLarge: return "request too large";
        case CloseReason::Shutdown:        return "server shutdown";
    }
    return "unknown";
}

CloseReason ConnectionHandler::serve(Session session) {
    Connection& connection = session.connection;
    state_ = HandlerState::Serving;
    GATEKV_LOG_INFO << "Serving " << connection.peer() << " [fd " << connection.fd() << "]";

    CloseReason reason;
    try {
        reason = run(connection);
    } catch (const BufferOverflowError& e) {
        reason = CloseReason::RequestTooLarge;
        GATEKV_LOG_WARN << "Dropping " << connection.peer() << ": " << e.what();
        connection.append_response(Protocol::format_error(e.what()));
        try {
            if (!flush(connection))
                reason = CloseReason::Shutdown;
        } catch (const IOError&) {
            // peer is gone, nothing left to tell it
        }
    } catch (const IOError& e) {
        reason = CloseReason::TransportError;
        GATEKV_LOG_WARN << "I/O error on " << connection.peer() << ": " << e.what();
    }

    connection.close();
    state_ = HandlerState::Closed;
    GATEKV_LOG_INFO << "Client " << connection.peer() << " disconnected (" << to_string(reason) << ")";
    return reason;
}

CloseReason ConnectionHandler::run(Connection& connection) {
    while (true) {
        if (wait_for(connection, POLLIN) == Wait::Shutdown)
            return CloseReason::Shutdown;

        if (!connection.read_to_inbox())
            return CloseReason::PeerClosed;

        while (auto line = connection.try_get_line()) {
            Command cmd;
            try {
                cmd = Protocol::parse(*line);
            } catch (const ProtocolError& e) {
                GATEKV_LOG_DEBUG << "Bad request from " << connection.peer() << ": " << e.what();
                connection.append_response(Protocol::format_error(e.what()));
                if (!flush(connection))
                    return CloseReason::Shutdown;
                return CloseReason::ProtocolError;
            }

            std::string response = CommandDispatcher::execute(cmd, store_);
            if (!response.empty())
                connection.append_response(response);
        }

        if (!flush(connection))
            return CloseReason::Shutdown;
    }
}

ConnectionHandler::Wait ConnectionHandler::wait_for(const Connection& connection, short events) const {
    pollfd fds[2] = {
        {connection.fd(), events, 0},
        {shutdown_fd_, POLLIN, 0}, // negative fd is ignored by poll
    };

    while (true) {
        int n = ::poll(fds, 2, -1);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            throw IOError{"poll failed"};
        }

        if (fds[1].revents & POLLIN)
            return Wait::Shutdown;

        short revents = fds[0].revents;
        if (revents & POLLNVAL)
            throw IOError{"socket closed underneath handler"};
        if (revents & events)
            return Wait::Ready;
        // readable hang-up is reported by read() returning 0
        if (revents & (POLLERR | POLLHUP)) {
            if (events & POLLIN)
                return Wait::Ready;
            throw IOError{"peer hung up"};
        }
    }
}

bool ConnectionHandler::flush(Connection& connection) const {
    while (connection.write_from_outbox()) {
        if (wait_for(connection, POLLOUT) == Wait::Shutdown)
            return false;
    }
    return true;
}

} // namespace gatekv
