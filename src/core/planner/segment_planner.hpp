#pragma once

#include <cstdint>
#include <vector>
#include "../model/transfer_types.hpp"

namespace segdl::core {

// Число сегментов для свежего старта: каждый сегмент не короче байта
[[nodiscard]] auto effective_worker_count(std::uint64_t total_size, std::uint32_t requested) -> std::uint32_t;

// Делит total_size на worker_count непрерывных диапазонов.
// Все, кроме последнего, получают total_size / worker_count байт,
// последний забирает остаток. Сумма размеров всегда равна total_size.
// При resume worker_count берётся из resume-записи, а не из запроса.
[[nodiscard]] auto plan_segments(std::uint64_t total_size, std::uint32_t worker_count) -> std::vector<Segment>;

// Один сегмент на весь ресурс (нет поддержки Range или размер неизвестен)
[[nodiscard]] auto plan_single_stream(std::optional<std::uint64_t> total_size) -> std::vector<Segment>;

} // namespace segdl::core
