#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include "model/transfer_types.hpp"
#include "../infra/monitoring/monitoring.hpp"
#include "../infra/retry.hpp"

namespace segdl::core {

// Бюджет повторов всей передачи, отдельный от попыток сегмента
struct TransferRetryPolicy {
    int budget = 3;
    std::chrono::milliseconds cooldown{30'000};
};

struct EngineOptions {
    infra::RetryPolicy segment_retry{};
    TransferRetryPolicy transfer_retry{};
    std::chrono::milliseconds poll_interval{100};        // частота опроса и событий прогресса
    std::chrono::milliseconds checkpoint_interval{1000};
    std::chrono::milliseconds pause_grace{5000};         // сколько ждать воркеры при паузе
    bool verify = false;                                 // логировать xxh64 результата
    std::optional<std::uint64_t> expected_xxh64;
};

// Общая возможность "передача": вызывающий код не знает, HTTP это
// или медиа-поток с внешним резолвером.
class Transfer {
public:
    virtual ~Transfer() = default;

    // Блокирует до завершения, паузы или отказа
    [[nodiscard]] virtual auto start() -> TransferResult = 0;

    // Можно звать из другого потока; start() вернёт paused = true
    virtual void pause() = 0;

    // Повторный запуск поверх сохранённого состояния
    [[nodiscard]] virtual auto resume() -> TransferResult = 0;

    virtual void subscribe(infra::ProgressObserver observer) = 0;

    [[nodiscard]] virtual auto state() const -> TransferState = 0;
    [[nodiscard]] virtual auto destination() const -> std::filesystem::path = 0;
};

} // namespace segdl::core
