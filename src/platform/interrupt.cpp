#include "interrupt.hpp"
#include <atomic>

namespace platform {

// The handler's only job is to flip the active token.
static std::atomic<std::atomic<bool>*> g_interrupt_flag{nullptr};

static void sigint_handler(int) {
    std::atomic<bool>* flag = g_interrupt_flag.load();
    if (flag) flag->store(true);
}

InterruptGuard::InterruptGuard(CancellationToken& token) {
    g_interrupt_flag.store(&token.flag());

    struct sigaction sa;
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    installed_ = sigaction(SIGINT, &sa, &old_sa_) == 0;
}

InterruptGuard::~InterruptGuard() {
    if (installed_) sigaction(SIGINT, &old_sa_, nullptr);
    g_interrupt_flag.store(nullptr);
}

} // namespace platform
