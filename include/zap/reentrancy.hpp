#ifndef ZAP_REENTRANCY_HPP
#define ZAP_REENTRANCY_HPP

#include <atomic>
#include <string>

#include "errors.hpp"

namespace zap {

// =============================================================================
// ReentrancyLock - one flag shared by every guarded entry point of an owner
// =============================================================================

class ReentrancyLock {
public:
    ReentrancyLock() = default;

    // Non-copyable
    ReentrancyLock(const ReentrancyLock&) = delete;
    ReentrancyLock& operator=(const ReentrancyLock&) = delete;

    bool locked() const { return locked_.load(std::memory_order_acquire); }

private:
    friend class ReentrancyGuard;

    std::atomic<bool> locked_{false};
};

// Scoped acquisition. Throws ZapError(REENTRANCY_VIOLATION) if the lock is
// already held; releases on every exit path, including exceptions.
class ReentrancyGuard {
public:
    explicit ReentrancyGuard(ReentrancyLock& lock, const char* where = "guarded call")
        : lock_(lock) {
        bool expected = false;
        if (!lock_.locked_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            throw ZapError(ErrorCode::REENTRANCY_VIOLATION,
                           std::string(where) + " entered while another call is in progress");
        }
    }

    ~ReentrancyGuard() {
        lock_.locked_.store(false, std::memory_order_release);
    }

    ReentrancyGuard(const ReentrancyGuard&) = delete;
    ReentrancyGuard& operator=(const ReentrancyGuard&) = delete;

private:
    ReentrancyLock& lock_;
};

} // namespace zap

#endif // ZAP_REENTRANCY_HPP
