#pragma once

#include "error_handler/error.hpp"
#include "interrupt.hpp"
#include <chrono>
#include <cmath>
#include <thread>
#include <spdlog/spdlog.h>

namespace segdl::infra {
/*

auto res = infra::with_retry([&](int attempt) {
    return fetch_range(session, segment, attempt);
}, infra::RetryPolicy{ .max_attempts = 5 }, &cancel);

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::milliseconds(1000);
    double backoff_factor = 2.0; // экспоненциальная задержка

    [[nodiscard]] auto delay_for(int attempt) const -> std::chrono::milliseconds {
        const auto scale = std::pow(backoff_factor, attempt);
        return std::chrono::milliseconds(
            static_cast<std::chrono::milliseconds::rep>(static_cast<double>(initial_delay.count()) * scale));
    }
};

// Повторяет operation(attempt) пока ошибка транзиентная и попытки не кончились.
// Отмена прерывает паузу между попытками и возвращает последний результат.
template<typename F>
[[nodiscard]] auto with_retry(F&& operation, const RetryPolicy& policy = {},
                              const CancellationToken* cancel = nullptr)
    -> decltype(operation(0))
{
    const int attempts = policy.max_attempts > 0 ? policy.max_attempts : 1;

    for (int attempt = 0; ; ++attempt) {
        auto result = operation(attempt);
        if (result.has_value()) {
            return result;
        }

        const auto& err = result.error();
        if (!err.is_transient() || attempt + 1 >= attempts) {
            return result; // фатальная ошибка или последняя попытка
        }
        if (cancel && cancel->requested()) {
            return result;
        }

        const auto delay = policy.delay_for(attempt);
        spdlog::debug("Attempt {}/{} failed ({}), retrying in {} ms",
                      attempt + 1, attempts, err.message, delay.count());

        if (cancel) {
            if (cancel->sleep_for(delay)) {
                return result;
            }
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
}

} // namespace segdl::infra
