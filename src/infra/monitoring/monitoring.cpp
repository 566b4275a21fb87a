#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <cstdio>

namespace segdl::infra {

auto SpeedMeter::sample(std::uint64_t total, std::chrono::steady_clock::time_point now) -> double {
    if (!last_time_) {
        reset(total, now);
        return speed_;
    }

    const double elapsed = std::chrono::duration<double>(now - *last_time_).count();
    if (elapsed <= 0.0) {
        return speed_;
    }

    const double delta = total >= last_total_ ? static_cast<double>(total - last_total_) : 0.0;
    const double instant = delta / elapsed;
    speed_ = speed_ * (1.0 - smoothing_) + instant * smoothing_;

    last_total_ = total;
    last_time_ = now;
    return speed_;
}

void SpeedMeter::reset(std::uint64_t total, std::chrono::steady_clock::time_point now) {
    speed_ = 0.0;
    last_total_ = total;
    last_time_ = now;
}

auto make_progress_event(std::uint64_t downloaded,
                         std::optional<std::uint64_t> total,
                         double speed_bps) -> ProgressEvent
{
    ProgressEvent event;
    event.bytes_downloaded = downloaded;
    event.bytes_total = total;
    event.speed_bps = speed_bps;

    if (total && *total > 0) {
        event.percent = std::min(100.0, static_cast<double>(downloaded) * 100.0 / static_cast<double>(*total));
        if (speed_bps > 0.0 && downloaded <= *total) {
            const double remaining = static_cast<double>(*total - downloaded);
            event.eta = std::chrono::seconds(static_cast<std::int64_t>(std::ceil(remaining / speed_bps)));
        }
    } else if (total) {
        // Известный нулевой размер: скачивать нечего
        event.percent = 100.0;
        event.eta = std::chrono::seconds(0);
    }
    return event;
}

auto format_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes >= 1024.0 * 1024 * 1024) { bytes /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (bytes >= 1024.0 * 1024) { bytes /= 1024.0 * 1024; unit = "MB"; }
    else if (bytes >= 1024.0) { bytes /= 1024.0; unit = "KB"; }
    return fmt::format("{:.1f} {}", bytes, unit);
}

auto format_eta(std::optional<std::chrono::seconds> eta) -> std::string {
    if (!eta) {
        return "inf";
    }
    auto seconds = eta->count();
    const auto hours = seconds / 3600;
    const auto minutes = (seconds % 3600) / 60;
    seconds = seconds % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
{}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::on_progress(const ProgressEvent& event) {
    std::lock_guard lock(mutex_);
    last_ = event;
    if (enabled_) {
        render_(event);
        line_open_ = true;
    }
}

void ProgressMonitor::finish() {
    std::lock_guard lock(mutex_);
    if (line_open_) {
        fmt::print("\n"); // финальный перенос
        std::fflush(stdout);
        line_open_ = false;
    }
}

auto ProgressMonitor::last_event() const -> std::optional<ProgressEvent> {
    std::lock_guard lock(mutex_);
    return last_;
}

void ProgressMonitor::render_(const ProgressEvent& event) const {
    constexpr int bar_width = 20;

    // Очистка строки и вывод
    fmt::print("\r\033[K"); // ANSI: очистить строку

    if (!event.percent) {
        fmt::print("{} | {}/s",
                   format_bytes(static_cast<double>(event.bytes_downloaded)),
                   format_bytes(event.speed_bps));
        std::fflush(stdout);
        return;
    }

    const int filled = std::clamp(static_cast<int>(*event.percent / 100.0 * bar_width), 0, bar_width);
    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    fmt::print(
        "[{}] {:5.1f}% | {}/s | ETA: {} | {}/{}",
        bar,
        *event.percent,
        format_bytes(event.speed_bps),
        format_eta(event.eta),
        format_bytes(static_cast<double>(event.bytes_downloaded)),
        format_bytes(static_cast<double>(event.bytes_total.value_or(0)))
    );
    std::fflush(stdout);
}

} // namespace segdl::infra
