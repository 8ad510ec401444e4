#pragma once

#include "gatekv/socket.hpp"
#include <cstddef>
#include <string>
#include <stdexcept>
#include <optional>
#include <utility>

namespace gatekv {

class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& msg) : std::runtime_error(msg) {}
};

class BufferOverflowError : public IOError {
    using IOError::IOError;
};

/*
 * One accepted client socket with its inbound and outbound buffers.
 * Owned by a single handler at a time, so no internal locking.
 */
class Connection {
public:
    Connection(Socket socket, std::string peer)
        : socket_(std::move(socket)), peer_(std::move(peer)) {}

    int fd() const noexcept { return socket_.fd(); }
    const std::string& peer() const noexcept { return peer_; }

    // append response to outbox
    void append_response(const std::string& data);

    // Write to client. Return true if there is still data left to send
    bool write_from_outbox();

    // returns false if client disconnected
    bool read_to_inbox();

    // return line if we have a full one (ends in \n)
    std::optional<std::string> try_get_line();

    bool inbox_has_data() const noexcept;
    bool outbox_has_data() const noexcept;

    void close() noexcept;

private:
    static constexpr size_t MAX_INBOX_SIZE = 1024 * 1024 * 2; // 2MB limit
    Socket socket_;
    std::string peer_;
    std::string inbox_;
    std::string outbox_;
};

} // namespace gatekv
