#pragma once

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>

namespace segdl::infra {

// Разделяемый флаг отмены. Копии токена смотрят на один и тот же флаг,
// поэтому supervisor, воркеры и обработчик сигналов видят одно состояние.
class CancellationToken {
public:
    CancellationToken();

    void request() noexcept { flag_->store(true, std::memory_order_relaxed); }
    void reset() noexcept { flag_->store(false, std::memory_order_relaxed); }

    [[nodiscard]] bool requested() const noexcept {
        return flag_->load(std::memory_order_relaxed);
    }

    // Спит не дольше duration, просыпаясь раньше при отмене.
    // Возвращает true, если отмена запрошена.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    friend void install_signal_handler(const CancellationToken& token);

    std::shared_ptr<std::atomic<bool>> flag_;
};

// SIGINT/SIGTERM взводят флаг токена. Сам обработчик ничего не логирует и
// не завершает процесс: паузу проводит владелец токена.
void install_signal_handler(const CancellationToken& token);

// Снимает привязку (восстанавливает SIG_DFL)
void remove_signal_handler();

} // namespace segdl::infra
