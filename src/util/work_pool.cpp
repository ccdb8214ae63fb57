#include "work_pool.h"

#include <cstring>

namespace gccorrect {

namespace {

std::atomic<CancellationToken*> g_active_token{nullptr};

extern "C" void cancel_on_interrupt(int) {
    CancellationToken* token = g_active_token.load();
    if (token != nullptr) token->cancel();
}

}  // namespace

InterruptScope::InterruptScope(CancellationToken& token) {
    g_active_token.store(&token);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = cancel_on_interrupt;
    sigemptyset(&action.sa_mask);
    installed_ = sigaction(SIGINT, &action, &previous_) == 0;
}

InterruptScope::~InterruptScope() {
    if (installed_) sigaction(SIGINT, &previous_, nullptr);
    g_active_token.store(nullptr);
}

}  // namespace gccorrect
