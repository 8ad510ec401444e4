#include "gatekv/admission_controller.hpp"
#include "gatekv/logger.hpp"

#include <cstdio>
#include <exception>
#include <stdexcept>

namespace gatekv {

AdmissionController::AdmissionController(size_t max_per_address, size_t max_total)
    : max_per_address_(max_per_address), max_total_(max_total) {
    if (max_per_address_ == 0)
        throw std::invalid_argument("max_per_address must be at least 1");
    if (max_total_ == 0)
        throw std::invalid_argument("max_total must be at least 1");
}

bool AdmissionController::try_accept(const std::string& address) {
    Verdict verdict;
    size_t address_count;
    size_t total;
    {
        std::lock_guard lock(mutex_);

        auto it = per_address_.find(address);
        address_count = it == per_address_.end() ? 0 : it->second;
        total = total_;

        if (total_ >= max_total_) {
            verdict = Verdict::TotalFull;
        } else if (address_count >= max_per_address_) {
            verdict = Verdict::AddressFull;
        } else {
            if (it == per_address_.end())
                it = per_address_.emplace(address, 0).first;
            address_count = ++it->second;
            total = ++total_;
            verdict = Verdict::Admitted;
        }

        if (verdict != Verdict::Admitted)
            ++rejected_;
    }

    // log after unlocking; nothing below touches the counters
    switch (verdict) {
        case Verdict::TotalFull:
            GATEKV_LOG_INFO << "Rejecting " << address << ": total limit reached ("
                            << total << "/" << max_total_ << ")";
            return false;
        case Verdict::AddressFull:
            GATEKV_LOG_INFO << "Rejecting " << address << ": per-address limit reached ("
                            << address_count << "/" << max_per_address_ << ")";
            return false;
        case Verdict::Admitted:
            break;
    }

    GATEKV_LOG_DEBUG << "Admitted " << address << " (address: " << address_count
                     << ", total: " << total << "/" << max_total_ << ")";
    return true;
}

void AdmissionController::release(const std::string& address) {
    bool held = false;
    size_t total;
    {
        std::lock_guard lock(mutex_);

        auto it = per_address_.find(address);
        if (it != per_address_.end() && it->second > 0) {
            held = true;
            --it->second;
            --total_;
            if (it->second == 0)
                per_address_.erase(it);
        }
        total = total_;
    }

    if (!held) {
        GATEKV_LOG_WARN << "Release for " << address << " which holds no slot";
        return;
    }

    GATEKV_LOG_DEBUG << "Released " << address << " (total: " << total << "/" << max_total_ << ")";
}

std::optional<AdmissionSlot> AdmissionController::try_acquire(const std::string& address) {
    if (!try_accept(address))
        return std::nullopt;
    return AdmissionSlot{this, address};
}

size_t AdmissionController::active_total() const {
    std::lock_guard lock(mutex_);
    return total_;
}

size_t AdmissionController::active_for(const std::string& address) const {
    std::lock_guard lock(mutex_);
    auto it = per_address_.find(address);
    return it == per_address_.end() ? 0 : it->second;
}

uint64_t AdmissionController::rejected_total() const {
    std::lock_guard lock(mutex_);
    return rejected_;
}


AdmissionSlot::~AdmissionSlot() {
    reset();
}

AdmissionSlot::AdmissionSlot(AdmissionSlot&& other) noexcept
    : controller_(other.controller_), address_(std::move(other.address_)) {
    other.controller_ = nullptr;
}

AdmissionSlot& AdmissionSlot::operator=(AdmissionSlot&& other) noexcept {
    if (this != &other) {
        reset();
        controller_ = other.controller_;
        address_ = std::move(other.address_);
        other.controller_ = nullptr;
    }
    return *this;
}

void AdmissionSlot::reset() noexcept {
    if (controller_ == nullptr)
        return;
    // null first so a second reset() cannot release twice
    AdmissionController* controller = controller_;
    controller_ = nullptr;
    try {
        controller->release(address_);
    } catch (const std::exception& e) {
        // std::clog may be what failed, so report on plain stderr
        std::fprintf(stderr, "gatekv: releasing slot for %s failed: %s\n", address_.c_str(), e.what());
    }
}

} // namespace gatekv
