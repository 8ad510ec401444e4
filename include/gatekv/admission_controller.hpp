#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace gatekv {

class AdmissionController;

/*
 * One admitted connection's hold on the controller.
 * Releases exactly once: on destruction, or earlier via reset().
 * Move-only; a moved-from slot releases nothing.
 */
class AdmissionSlot {
public:
    AdmissionSlot() noexcept = default;
    ~AdmissionSlot();

    AdmissionSlot(const AdmissionSlot&) = delete;
    AdmissionSlot& operator=(const AdmissionSlot&) = delete;

    AdmissionSlot(AdmissionSlot&& other) noexcept;
    AdmissionSlot& operator=(AdmissionSlot&& other) noexcept;

    bool held() const noexcept { return controller_ != nullptr; }
    const std::string& address() const noexcept { return address_; }

    void reset() noexcept;

private:
    friend class AdmissionController;
    AdmissionSlot(AdmissionController* controller, std::string address) noexcept
        : controller_(controller), address_(std::move(address)) {}

    AdmissionController* controller_{nullptr};
    std::string address_;
};

/*
 * Decides whether a new connection may be served.
 *
 * Two limits apply at the same time:
 *   max_per_address  simultaneous connections from one client address
 *   max_total        simultaneous connections across all addresses
 *
 * The check of both limits and the increment of both counters happen under
 * a single lock, so no two callers can pass the check for the last free slot.
 * Limits are fixed at construction.
 */
class AdmissionController {
public:
    // Throws std::invalid_argument if a limit is 0
    AdmissionController(size_t max_per_address, size_t max_total);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Accepts and counts the connection, or rejects it and changes nothing.
    // Every true result must be paired with exactly one release(address).
    bool try_accept(const std::string& address);

    // Gives back one slot held by address. No-op if address holds none.
    // Both calls log only after the lock is dropped.
    void release(const std::string& address);

    // try_accept() wrapped in a slot that releases itself
    std::optional<AdmissionSlot> try_acquire(const std::string& address);

    size_t active_total() const;
    size_t active_for(const std::string& address) const;
    uint64_t rejected_total() const;

    size_t max_per_address() const noexcept { return max_per_address_; }
    size_t max_total() const noexcept { return max_total_; }

private:
    enum class Verdict { Admitted, TotalFull, AddressFull };

    const size_t max_per_address_;
    const size_t max_total_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> per_address_; // no entry == 0
    size_t total_{0};
    uint64_t rejected_{0};
};

} // namespace gatekv
