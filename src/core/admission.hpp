/**
 * execbox Admission Control
 *
 * Bounds the number of sandboxes running at once. Excess requests either
 * wait in a bounded FIFO queue or are rejected right away, depending on
 * the configured mode.
 */
#pragma once
#include <cstdint>
#include <string>
#include <deque>
#include <mutex>
#include <condition_variable>

namespace execbox::core {

enum class AdmissionMode {
    QUEUE,      // Wait for a slot (bounded queue, bounded wait)
    REJECT      // Fail immediately when every slot is busy
};

const char* admission_mode_to_string(AdmissionMode mode);
// Returns false for unknown names
bool admission_mode_from_string(const std::string& str, AdmissionMode& out);

struct AdmissionConfig {
    uint32_t max_concurrent = 5;
    AdmissionMode mode = AdmissionMode::QUEUE;
    uint32_t max_queue_depth = 16;
    uint32_t queue_timeout_ms = 30000;   // 0 = wait forever
};

class AdmissionController {
public:
    // Held for the lifetime of one execution
    class Slot {
    public:
        Slot() = default;
        ~Slot() { release(); }

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;
        Slot(Slot&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;

        bool held() const { return owner_ != nullptr; }
        void release();

    private:
        friend class AdmissionController;
        explicit Slot(AdmissionController* owner) : owner_(owner) {}

        AdmissionController* owner_ = nullptr;
    };

    explicit AdmissionController(const AdmissionConfig& config);

    AdmissionController(const AdmissionController&) = delete;
    AdmissionController& operator=(const AdmissionController&) = delete;

    // Throws OverloadedError (no slot, full queue, wait timed out) or
    // ShuttingDownError (closed before or while waiting)
    Slot acquire();

    // Refuse new work and wake every waiter
    void close();
    bool closed() const;

    const AdmissionConfig& config() const { return config_; }
    uint32_t in_flight() const;
    uint32_t queued() const;
    uint64_t rejected() const;
    uint64_t admitted() const;

private:
    void release_slot();

    AdmissionConfig config_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<uint64_t> waiters_;   // FIFO of waiting tickets
    uint64_t next_ticket_ = 0;
    uint32_t in_flight_ = 0;
    uint64_t rejected_ = 0;
    uint64_t admitted_ = 0;
    bool closed_ = false;
};

} // namespace execbox::core
