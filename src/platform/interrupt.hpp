#pragma once

#include <core/cancellation.hpp>
#include <signal.h>

namespace platform {

// While alive, SIGINT cancels the given token instead of killing the
// process. The previous SIGINT disposition is restored on destruction.
// Only one guard may be active at a time.
class InterruptGuard {
public:
    explicit InterruptGuard(CancellationToken& token);
    ~InterruptGuard();

    InterruptGuard(const InterruptGuard&) = delete;
    InterruptGuard& operator=(const InterruptGuard&) = delete;

private:
    struct sigaction old_sa_;
    bool installed_ = false;
};

} // namespace platform
