#pragma once

#include <optional>
#include <string>

struct sockaddr;

namespace gatekv {

/*
 * RAII wrapper for a POSIX socket descriptor
 *
 * Owns the descriptor and closes it on destruction
 * Move-only
 */
class Socket {
public:
    // Constructs an invalid socket
    Socket() noexcept;

    // Takes ownership of an existing file descriptor
    explicit Socket(int fd) noexcept;

    // Closes the socket if valid
    ~Socket();

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;

    bool valid() const noexcept;
    int fd() const noexcept;

    // Textual IP of the remote end ("192.168.0.7", "::1").
    // The port is left out so every connection from one host maps to the same key.
    // nullopt if the peer is unknown (closed socket, AF_UNIX pair).
    std::optional<std::string> peer_address() const;

    // Local port the socket is bound to, 0 if unbound
    unsigned short local_port() const;

private:
    int fd_;
};

// Formats the IP part of an AF_INET / AF_INET6 address
std::optional<std::string> format_ip(const sockaddr* addr);

} // namespace gatekv
