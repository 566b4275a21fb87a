#include "interrupt.hpp"
#include <algorithm>
#include <thread>

namespace segdl::infra {

namespace {

// Обработчику доступен только lock-free атомик, сам токен живёт в shared_ptr
std::atomic<std::atomic<bool>*> g_signal_flag{nullptr};
std::shared_ptr<std::atomic<bool>> g_signal_flag_owner;

static_assert(std::atomic<bool>::is_always_lock_free);

extern "C" void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        if (auto* flag = g_signal_flag.load(std::memory_order_relaxed)) {
            flag->store(true, std::memory_order_relaxed);
        }
    }
}

} // namespace

CancellationToken::CancellationToken()
    : flag_(std::make_shared<std::atomic<bool>>(false))
{}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    constexpr auto slice = std::chrono::milliseconds(50);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!requested()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, slice));
    }
    return requested();
}

void install_signal_handler(const CancellationToken& token) {
    g_signal_flag_owner = token.flag_;
    g_signal_flag.store(token.flag_.get(), std::memory_order_relaxed);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void remove_signal_handler() {
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_signal_flag.store(nullptr, std::memory_order_relaxed);
    g_signal_flag_owner.reset();
}

} // namespace segdl::infra
