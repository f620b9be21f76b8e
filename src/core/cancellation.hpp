#pragma once

#include <atomic>

// Cooperative cancellation flag shared between a signal handler (or a test)
// and the orchestrating loop. Setting it never interrupts work in progress;
// the holder decides when to look.
class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

    // Raw flag for async-signal-safe writers (lock-free on all supported targets).
    std::atomic<bool>& flag() { return cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};
