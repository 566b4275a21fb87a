#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <expected>
#include <filesystem>

namespace segdl::args_parser {
    struct CLIArgs;
}

namespace segdl::infra {

struct Config {
    // Сегментация и I/O
    std::optional<std::uint32_t> workers;       // число сегментов для нового запуска
    std::optional<std::size_t> chunk_size;      // bytes, размер буфера чтения

    // Повторы: два независимых бюджета
    // Поля, которые может задать CLI, хранятся как optional: значение по умолчанию
    // подставляют effective_*()
    std::optional<int> segment_attempts;
    std::chrono::milliseconds segment_backoff{1000};   // удваивается с каждой попыткой
    std::optional<int> transfer_retries;
    std::optional<std::chrono::milliseconds> retry_cooldown;

    // Таймауты сети
    std::chrono::milliseconds probe_timeout{10'000};
    std::chrono::milliseconds connect_timeout{10'000};
    std::optional<std::chrono::milliseconds> read_timeout;

    // Периодичность
    std::chrono::milliseconds progress_interval{100};
    std::chrono::milliseconds checkpoint_interval{1000};

    // Пути и поведение
    std::optional<std::filesystem::path> output_dir;
    std::string user_agent = "segdl/1.0";
    bool verify = false;
    std::optional<std::uint64_t> expected_xxh64;
    bool progress = true;
    bool quiet = false;
    bool history = true;
    std::optional<std::string> log_level;

    // Слияние с другим Config (например, из CLI); other имеет приоритет
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_output_dir() const -> std::filesystem::path {
        return output_dir.value_or("downloads");
    }
    [[nodiscard]] auto effective_segment_attempts() const -> int { return segment_attempts.value_or(3); }
    [[nodiscard]] auto effective_transfer_retries() const -> int { return transfer_retries.value_or(3); }
    [[nodiscard]] auto effective_retry_cooldown() const -> std::chrono::milliseconds {
        return retry_cooldown.value_or(std::chrono::seconds(30));
    }
    [[nodiscard]] auto effective_read_timeout() const -> std::chrono::milliseconds {
        return read_timeout.value_or(std::chrono::seconds(30));
    }
    [[nodiscard]] auto effective_log_level() const -> std::string { return log_level.value_or("info"); }
};

// Разбирает hex-строку xxh64 ("0x" допускается)
[[nodiscard]] auto parse_xxh64(std::string_view text) -> std::optional<std::uint64_t>;

/// Загружает конфигурацию из YAML.
/// Ищет файл в порядке:
///   1. ./.segdl.yaml
///   2. $XDG_CONFIG_HOME/segdl/config.yaml
///   3. ~/.config/segdl/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

/// Загружает конкретный файл (--config). Отсутствие файла здесь ошибка.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов
[[nodiscard]] auto config_from_cli(const segdl::args_parser::CLIArgs& args) -> Config;

} // namespace segdl::infra
