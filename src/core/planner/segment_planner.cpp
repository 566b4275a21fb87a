#include "segment_planner.hpp"

#include <algorithm>

namespace segdl::core {

auto effective_worker_count(std::uint64_t total_size, std::uint32_t requested) -> std::uint32_t {
    const std::uint64_t capped = std::min<std::uint64_t>(std::max<std::uint32_t>(requested, 1), total_size);
    return static_cast<std::uint32_t>(std::max<std::uint64_t>(capped, 1));
}

auto plan_segments(std::uint64_t total_size, std::uint32_t worker_count) -> std::vector<Segment> {
    if (total_size == 0) {
        return plan_single_stream(0);
    }

    const std::uint32_t count = effective_worker_count(total_size, worker_count);
    const std::uint64_t chunk = total_size / count;

    std::vector<Segment> segments;
    segments.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        const std::uint64_t first = static_cast<std::uint64_t>(i) * chunk;
        const std::uint64_t last = (i + 1 == count) ? total_size - 1 : first + chunk - 1;

        Segment segment;
        segment.index = i;
        segment.span = ByteSpan{first, last};
        segment.expected_size = segment.span->size();
        segments.push_back(segment);
    }
    return segments;
}

auto plan_single_stream(std::optional<std::uint64_t> total_size) -> std::vector<Segment> {
    Segment segment;
    segment.index = 0;
    segment.expected_size = total_size;
    return {segment};
}

} // namespace segdl::core
