#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace segdl::infra {

// Событие прогресса, которое supervisor рассылает наблюдателям (~10 Гц)
struct ProgressEvent {
    std::optional<double> percent;              // нет, если размер неизвестен
    double speed_bps = 0.0;                     // сглаженная скорость, байт/с
    std::uint64_t bytes_downloaded = 0;
    std::optional<std::uint64_t> bytes_total;
    std::optional<std::chrono::seconds> eta;
};

using ProgressObserver = std::function<void(const ProgressEvent&)>;

// Экспоненциальное сглаживание мгновенной скорости: 0.7 старого + 0.3 нового
class SpeedMeter {
public:
    explicit SpeedMeter(double smoothing = 0.3) : smoothing_(smoothing) {}

    // total: совокупно скачанные байты на момент now
    auto sample(std::uint64_t total, std::chrono::steady_clock::time_point now) -> double;

    void reset(std::uint64_t total, std::chrono::steady_clock::time_point now);

    [[nodiscard]] auto speed() const -> double { return speed_; }

private:
    double smoothing_;
    double speed_ = 0.0;
    std::uint64_t last_total_ = 0;
    std::optional<std::chrono::steady_clock::time_point> last_time_;
};

// Собирает ProgressEvent из счётчиков
[[nodiscard]] auto make_progress_event(std::uint64_t downloaded,
                                       std::optional<std::uint64_t> total,
                                       double speed_bps) -> ProgressEvent;

[[nodiscard]] auto format_bytes(double bytes) -> std::string;
[[nodiscard]] auto format_eta(std::optional<std::chrono::seconds> eta) -> std::string;

// Наблюдатель для терминала: рисует строку прогресса поверх предыдущей
class ProgressMonitor {
public:
    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void on_progress(const ProgressEvent& event);

    // Завершает строку прогресса переводом строки
    void finish();

    [[nodiscard]] auto observer() -> ProgressObserver {
        return [this](const ProgressEvent& event) { on_progress(event); };
    }

    [[nodiscard]] auto last_event() const -> std::optional<ProgressEvent>;

private:
    void render_(const ProgressEvent& event) const;

    const bool enabled_;
    mutable std::mutex mutex_;
    std::optional<ProgressEvent> last_;
    bool line_open_ = false;
};

} // namespace segdl::infra
