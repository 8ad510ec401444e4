#include "gatekv/socket.hpp"

#include <arpa/inet.h>   // inet_ntop()
#include <netinet/in.h>  // sockaddr_in, sockaddr_in6
#include <sys/socket.h>  // getpeername(), getsockname()
#include <unistd.h>      // close()


namespace gatekv {


Socket::Socket() noexcept: fd_(-1) {}

Socket::Socket(int fd) noexcept: fd_(fd) {}

Socket::~Socket() {
    if (fd_ != -1) {
        ::close(fd_);
    }
}

Socket::Socket(Socket&& other) noexcept: fd_(other.fd_) {
    other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        if (fd_ != -1) {
            ::close(fd_);
        }
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

bool Socket::valid() const noexcept {
    return fd_ != -1;
}

int Socket::fd() const noexcept {
    return fd_;
}

std::optional<std::string> Socket::peer_address() const {
    if (fd_ == -1)
        return std::nullopt;

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        return std::nullopt;

    return format_ip(reinterpret_cast<const sockaddr*>(&addr));
}

unsigned short Socket::local_port() const {
    if (fd_ == -1)
        return 0;

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) == -1)
        return 0;

    if (addr.ss_family == AF_INET)
        return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    if (addr.ss_family == AF_INET6)
        return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    return 0;
}

std::optional<std::string> format_ip(const sockaddr* addr) {
    char buf[INET6_ADDRSTRLEN] = {};

    if (addr->sa_family == AF_INET) {
        auto* in4 = reinterpret_cast<const sockaddr_in*>(addr);
        if (::inet_ntop(AF_INET, &in4->sin_addr, buf, sizeof(buf)) == nullptr)
            return std::nullopt;
        return std::string{buf};
    }

    if (addr->sa_family == AF_INET6) {
        auto* in6 = reinterpret_cast<const sockaddr_in6*>(addr);
        // an IPv4 client on a dual-stack listener should share its count with plain IPv4
        if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
            if (::inet_ntop(AF_INET, &in6->sin6_addr.s6_addr[12], buf, sizeof(buf)) == nullptr)
                return std::nullopt;
            return std::string{buf};
        }
        if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf)) == nullptr)
            return std::nullopt;
        return std::string{buf};
    }

    return std::nullopt;
}

} // namespace gatekv
