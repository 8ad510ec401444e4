#include "waker.hpp"

#include <cerrno>
#include <fcntl.h>
#include <stdexcept>
#include <unistd.h>

namespace gatekv {

Waker::Waker() {
    if (::pipe2(pipe_fds_, O_NONBLOCK | O_CLOEXEC) == -1)
        throw std::runtime_error("Failed to create self-pipe");
}

Waker::~Waker() {
    ::close(pipe_fds_[0]);
    ::close(pipe_fds_[1]);
}

int Waker::read_fd() const noexcept {
    return pipe_fds_[0];
}

void Waker::notify() noexcept {
    char c = 'x';
    while (::write(pipe_fds_[1], &c, 1) == -1) {
        // EAGAIN: pipe full, already readable
        if (errno != EINTR)
            return;
    }
}

} // namespace gatekv
