#pragma once

namespace gatekv {

/*
 * Self-pipe used to interrupt poll(2) waits.
 *
 * The listener and every connection handler include read_fd() in their
 * poll set. notify() makes it readable for all of them at once; nothing
 * drains it, so it stays readable. notify() is async-signal-safe.
 */
class Waker {
public:
    // Throws std::runtime_error if the pipe cannot be created
    Waker();
    ~Waker();

    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;

    int read_fd() const noexcept;

    void notify() noexcept;

private:
    int pipe_fds_[2];
};

} // namespace gatekv
