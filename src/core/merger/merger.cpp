#include "merger.hpp"
#include "../../adapters/fs.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::core {

auto validate_segments(const std::vector<Segment>& segments,
                       const std::filesystem::path& parts_dir) -> infra::VoidResult
{
    if (segments.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Corruption, "Nothing to merge"));
    }

    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.index != i) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Corruption,
                                 fmt::format("Segment order broken at position {}", i)));
        }

        const auto path = part_file(parts_dir, segment.index);
        const auto actual = adapters::fs::file_size(path);
        if (actual < 0 && segment.expected_size == 0) {
            continue; // пустой ресурс: сегмент нечего было качать
        }
        if (actual < 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Corruption,
                                 fmt::format("Missing part file {}", segment.index)));
        }

        // Неизвестный размер бывает только у единственного сегмента: проверять не с чем
        if (segment.expected_size && static_cast<std::uint64_t>(actual) != *segment.expected_size) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Corruption,
                                 fmt::format("Part {} size mismatch: expected {}, got {}",
                                             segment.index, *segment.expected_size, actual)));
        }
    }
    return {};
}

auto merge_segments(const std::vector<Segment>& segments,
                    const std::filesystem::path& parts_dir,
                    const std::filesystem::path& destination,
                    extensions::ResumeStore& store) -> infra::VoidResult
{
    if (auto valid = validate_segments(segments, parts_dir); !valid) {
        return valid;
    }

    std::vector<std::filesystem::path> parts;
    parts.reserve(segments.size());
    for (const auto& segment : segments) {
        auto path = part_file(parts_dir, segment.index);
        if (segment.expected_size == 0 && adapters::fs::file_size(path) < 0) {
            continue;
        }
        parts.push_back(std::move(path));
    }

    // Склеиваем во временный файл, чтобы не оставить полуготовый destination
    auto staging = destination;
    staging += ".merging";
    if (auto res = adapters::fs::concat_files(parts, staging); !res) {
        return res;
    }

    std::error_code ec;
    std::filesystem::rename(staging, destination, ec);
    if (ec) {
        adapters::fs::remove_quietly(staging);
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot move merged file to {}: {}", destination.string(), ec.message())));
    }

    store.clear();
    spdlog::info("Successfully merged to: {}", destination.string());
    return {};
}

} // namespace segdl::core
