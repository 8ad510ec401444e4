#include "connection.hpp"

#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>

namespace gatekv {


bool Connection::read_to_inbox() {
    char buffer[4096];
    ssize_t n = ::read(socket_.fd(), buffer, sizeof(buffer));

    if (n == 0)
        return false;
    if (n < 0) {
        if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
            return true; // nothing to read right now
        if (errno == ECONNRESET)
            return false;
        throw IOError{"read failed"};
    }
    if (inbox_.size() + n > MAX_INBOX_SIZE) {
        inbox_.clear();
        throw BufferOverflowError{"request too large"};
    }

    inbox_.append(buffer, n);
    return true;
}

std::optional<std::string> Connection::try_get_line() {
    auto pos = inbox_.find('\n');
    if (pos == std::string::npos)
        return std::nullopt; // No full line yet

    std::string line = inbox_.substr(0, pos);
    inbox_.erase(0, pos + 1);
    return line;
}

void Connection::append_response(const std::string& data) {
    outbox_.append(data);
}

bool Connection::write_from_outbox() {
    if (outbox_.empty())
        return false;

    // MSG_NOSIGNAL: don't SIGPIPE us if the socket is dead
    ssize_t n = ::send(socket_.fd(), outbox_.data(), outbox_.size(), MSG_NOSIGNAL);
    if (n >= 0) {
        outbox_.erase(0, n);
        return !outbox_.empty();
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return true;
    throw IOError("write failed");
}

bool Connection::inbox_has_data() const noexcept {
    return !inbox_.empty();
}

bool Connection::outbox_has_data() const noexcept {
    return !outbox_.empty();
}

void Connection::close() noexcept {
    socket_ = Socket{};
}

} // namespace gatekv
