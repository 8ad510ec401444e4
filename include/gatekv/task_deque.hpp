#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace gatekv {

/*
 * Blocking hand-off queue between the listener and the worker pool.
 * T only needs to be movable.
 */
template <typename T>
class TaskDeque {
public:
    // Listener drops off work and wakes one worker
    void push_back(T task) {
        {
            std::lock_guard lock(deque_mutex_);
            deque_.push_back(std::move(task));
        }
        cv_.notify_one();
    }

    // Blocks until an item is available.
    // Returns std::nullopt once stop is requested on the calling worker.
    std::optional<T> wait_and_pop_front(std::stop_token stop_token) {
        std::unique_lock lock(deque_mutex_);
        bool ready = cv_.wait(lock, stop_token, [this]() {
            return !deque_.empty();
        });

        if (!ready)
            return std::nullopt;

        T task = std::move(deque_.front());
        deque_.pop_front();
        return task;
    }

    // Removes everything still queued, for teardown after the workers are gone
    std::deque<T> drain() {
        std::lock_guard lock(deque_mutex_);
        std::deque<T> rest;
        rest.swap(deque_);
        return rest;
    }

private:
    std::deque<T> deque_;
    mutable std::mutex deque_mutex_;
    std::condition_variable_any cv_;
};

} // namespace gatekv
