#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace segdl::core {

// Производит имя файла из последнего сегмента пути URL:
// только [A-Za-z0-9._-], не длиннее 255, иначе "download"
[[nodiscard]] auto derive_filename(std::string_view url) -> std::string;

// Неизменяемый запрос. Ключ для сопоставления resume-записи: (url, filename).
struct TransferRequest {
    std::string url;
    std::filesystem::path output_dir;
    std::string filename;
    std::uint32_t workers = 8;
    std::optional<std::uint64_t> size_hint;     // размер от внешнего источника, если сервер молчит

    [[nodiscard]] static auto make(std::string url,
                                   std::filesystem::path output_dir,
                                   std::uint32_t workers,
                                   std::optional<std::string> explicit_filename = std::nullopt)
        -> TransferRequest;

    [[nodiscard]] auto destination() const -> std::filesystem::path { return output_dir / filename; }
    [[nodiscard]] auto resume_file() const -> std::filesystem::path { return output_dir / (filename + ".resume"); }
    [[nodiscard]] auto parts_dir() const -> std::filesystem::path { return output_dir / ("." + filename + ".parts"); }
};

// Инклюзивный диапазон байт [first, last]
struct ByteSpan {
    std::uint64_t first = 0;
    std::uint64_t last = 0;

    [[nodiscard]] auto size() const -> std::uint64_t { return last - first + 1; }
    auto operator==(const ByteSpan&) const -> bool = default;
};

// Выводится один раз на свежий старт
struct TransferPlan {
    std::optional<std::uint64_t> total_size;
    bool ranges_supported = false;
    std::uint32_t workers = 1;              // эффективное число сегментов
    std::uint32_t original_workers = 1;     // заморожено на всё время жизни resume-записи

    // Resume возможен, только когда границы сегментов вычислимы
    [[nodiscard]] auto resumable() const -> bool { return ranges_supported && total_size.has_value(); }
};

// Инвариант: downloaded <= expected_size (если известен)
struct Segment {
    std::uint32_t index = 0;
    std::optional<ByteSpan> span;                   // нет в однопоточном режиме
    std::optional<std::uint64_t> expected_size;     // нет, если размер ресурса неизвестен
    std::uint64_t downloaded = 0;

    [[nodiscard]] auto complete() const -> bool {
        return expected_size && downloaded == *expected_size;
    }
    [[nodiscard]] auto remaining() const -> std::optional<std::uint64_t> {
        if (!expected_size) return std::nullopt;
        return *expected_size - downloaded;
    }
};

[[nodiscard]] auto part_file(const std::filesystem::path& parts_dir, std::uint32_t index) -> std::filesystem::path;

// Снимок для resume-файла
struct ResumeRecord {
    std::string url;
    std::string filename;
    std::uint64_t file_size = 0;
    std::map<std::uint32_t, std::uint64_t> parts;   // index -> скачано байт
    double timestamp = 0.0;                         // секунды unix time
    std::uint32_t original_workers = 1;
};

enum class TransferState {
    Idle,
    Planning,
    Running,
    Paused,
    Retrying,
    Merging,
    Completed,
    Failed,
};

[[nodiscard]] auto to_string(TransferState state) -> std::string_view;

struct TransferStats {
    std::uint64_t bytes_downloaded = 0;     // за этот запуск
    std::uint64_t bytes_total = 0;
    std::chrono::milliseconds elapsed{0};
    int transfer_attempts = 0;
};

// Итог start()/resume(). Неудача: значение, а не исключение.
struct TransferResult {
    bool success = false;
    bool paused = false;
    std::filesystem::path destination;
    std::optional<infra::Error> error;
    TransferStats stats;
};

} // namespace segdl::core
