#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>
#include "../model/transfer_types.hpp"

namespace segdl::core {

// Счётчики одного прогона под одним мьютексом: воркеры пишут,
// supervisor читает. Передаётся воркерам явно, глобальных нет.
class SharedProgress {
public:
    struct Snapshot {
        std::uint64_t downloaded = 0;
        std::vector<Segment> segments;
        std::uint32_t errors = 0;
    };

    SharedProgress(std::vector<Segment> segments, std::optional<std::uint64_t> total_size);

    SharedProgress(const SharedProgress&) = delete;
    SharedProgress& operator=(const SharedProgress&) = delete;

    // Учёт нового куска сегмента
    void add_bytes(std::uint32_t index, std::uint64_t bytes);

    // Сегмент закончен (нужно для режима с неизвестным размером)
    void mark_finished(std::uint32_t index);

    void record_error();
    void clear_errors();

    [[nodiscard]] auto segment(std::uint32_t index) const -> Segment;
    [[nodiscard]] auto finished(std::uint32_t index) const -> bool;
    [[nodiscard]] auto downloaded() const -> std::uint64_t;
    [[nodiscard]] auto error_count() const -> std::uint32_t;
    [[nodiscard]] auto total_size() const -> std::optional<std::uint64_t> { return total_size_; }
    [[nodiscard]] auto snapshot() const -> Snapshot;

    // Индексы сегментов, которые ещё нужно качать
    [[nodiscard]] auto incomplete() const -> std::vector<std::uint32_t>;

    // Все сегменты закончены; при известном размере сумма равна total_size
    [[nodiscard]] auto all_complete() const -> bool;

    // Разрешает не более одной записи чекпоинта за interval.
    // true: вызывающий обязан сохранить снимок.
    [[nodiscard]] auto claim_checkpoint(std::chrono::milliseconds interval,
                                        std::chrono::steady_clock::time_point now
                                            = std::chrono::steady_clock::now()) -> bool;

private:
    [[nodiscard]] auto all_complete_locked() const -> bool;

    mutable std::mutex mutex_;
    std::vector<Segment> segments_;
    std::vector<bool> finished_;
    std::optional<std::uint64_t> total_size_;
    std::uint64_t downloaded_ = 0;
    std::uint32_t errors_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_checkpoint_;
};

} // namespace segdl::core
