#pragma once

#include <filesystem>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace segdl::adapters::fs {

enum class AppendStrategy {
    Buffered,    // < 1 MB
    MMap,        // 1 MB – 100 MB
    Uring,       // >= 100 MB (Linux, io_uring), иначе Buffered
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> AppendStrategy;

// Дописывает содержимое src в конец открытого на запись дескриптора dst_fd
[[nodiscard]] auto append_file(
    const std::filesystem::path& src,
    int dst_fd,
    AppendStrategy strategy = AppendStrategy::Buffered
) -> infra::VoidResult;

// Создаёт (или перезаписывает) dst как конкатенацию parts по порядку, с fsync.
// При ошибке недописанный dst удаляется.
[[nodiscard]] auto concat_files(
    const std::vector<std::filesystem::path>& parts,
    const std::filesystem::path& dst
) -> infra::VoidResult;

// Пишет во временный соседний файл, fsync, затем rename поверх target.
// Читатель никогда не видит частично записанный target.
[[nodiscard]] auto atomic_write(
    const std::filesystem::path& target,
    std::string_view content
) -> infra::VoidResult;

[[nodiscard]] auto ensure_directory(const std::filesystem::path& dir) -> infra::VoidResult;

// Размер файла или nullopt-эквивалент -1, если файла нет
[[nodiscard]] auto file_size(const std::filesystem::path& path) -> std::int64_t;

// Удаление без ошибок: отсутствующий файл не ошибка. false: удалить не вышло.
auto remove_quietly(const std::filesystem::path& path) -> bool;

// Пробная запись в каталог
[[nodiscard]] auto is_writable_directory(const std::filesystem::path& dir) -> bool;

} // namespace segdl::adapters::fs
