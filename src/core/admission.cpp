#include "core/admission.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <string>

namespace execbox::core {

const char* admission_mode_to_string(AdmissionMode mode) {
    switch (mode) {
        case AdmissionMode::QUEUE: return "queue";
        case AdmissionMode::REJECT: return "reject";
        default: return "unknown";
    }
}

bool admission_mode_from_string(const std::string& str, AdmissionMode& out) {
    if (str == "queue") {
        out = AdmissionMode::QUEUE;
    } else if (str == "reject") {
        out = AdmissionMode::REJECT;
    } else {
        return false;
    }
    return true;
}

// ============================================================================
// Slot
// ============================================================================

AdmissionController::Slot& AdmissionController::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void AdmissionController::Slot::release() {
    if (owner_) {
        owner_->release_slot();
        owner_ = nullptr;
    }
}

// ============================================================================
// AdmissionController
// ============================================================================

AdmissionController::AdmissionController(const AdmissionConfig& config)
    : config_(config) {}

AdmissionController::Slot AdmissionController::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);

    if (closed_) {
        throw ShuttingDownError("dispatcher is shutting down");
    }

    // Fast path: a free slot and nobody ahead of us
    if (waiters_.empty() && in_flight_ < config_.max_concurrent) {
        ++in_flight_;
        ++admitted_;
        return Slot(this);
    }

    if (config_.mode == AdmissionMode::REJECT) {
        ++rejected_;
        throw OverloadedError("all " + std::to_string(config_.max_concurrent) +
                              " sandbox slots are busy");
    }

    if (waiters_.size() >= config_.max_queue_depth) {
        ++rejected_;
        throw OverloadedError("admission queue is full (" +
                              std::to_string(config_.max_queue_depth) + " waiting)");
    }

    const uint64_t ticket = next_ticket_++;
    waiters_.push_back(ticket);
    spdlog::debug("Request queued for admission (ticket {}, {} waiting)", ticket, waiters_.size());

    auto my_turn = [&]() {
        return closed_ || (waiters_.front() == ticket && in_flight_ < config_.max_concurrent);
    };

    bool admitted;
    if (config_.queue_timeout_ms == 0) {
        cv_.wait(lock, my_turn);
        admitted = true;
    } else {
        admitted = cv_.wait_for(lock, std::chrono::milliseconds(config_.queue_timeout_ms), my_turn);
    }

    waiters_.erase(std::find(waiters_.begin(), waiters_.end(), ticket));

    if (closed_) {
        cv_.notify_all();
        throw ShuttingDownError("dispatcher shut down while request was queued");
    }
    if (!admitted) {
        ++rejected_;
        // The next waiter may be eligible now that we left the head
        cv_.notify_all();
        throw OverloadedError("timed out after " + std::to_string(config_.queue_timeout_ms) +
                              "ms waiting for a sandbox slot");
    }

    ++in_flight_;
    ++admitted_;
    // Wake the new head in case more than one slot is free
    cv_.notify_all();
    return Slot(this);
}

void AdmissionController::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0) {
            --in_flight_;
        }
    }
    cv_.notify_all();
}

void AdmissionController::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool AdmissionController::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

uint32_t AdmissionController::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

uint32_t AdmissionController::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(waiters_.size());
}

uint64_t AdmissionController::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rejected_;
}

uint64_t AdmissionController::admitted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return admitted_;
}

} // namespace execbox::core
