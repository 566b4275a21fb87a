#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <charconv>
#include <cstdlib>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace segdl::infra {

    void Config::merge_with(const Config& other) {
        if (other.workers) workers = other.workers;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.output_dir) output_dir = other.output_dir;
        if (other.expected_xxh64) expected_xxh64 = other.expected_xxh64;
        if (other.segment_attempts) segment_attempts = other.segment_attempts;
        if (other.transfer_retries) transfer_retries = other.transfer_retries;
        if (other.retry_cooldown) retry_cooldown = other.retry_cooldown;
        if (other.read_timeout) read_timeout = other.read_timeout;
        if (other.log_level) log_level = other.log_level;

        if (other.verify) verify = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
        if (!other.history) history = false;
    }

    auto parse_xxh64(std::string_view text) -> std::optional<std::uint64_t> {
        if (text.starts_with("0x") || text.starts_with("0X")) {
            text.remove_prefix(2);
        }
        if (text.empty() || text.size() > 16) {
            return std::nullopt;
        }
        std::uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
        if (ec != std::errc{} || ptr != text.data() + text.size()) {
            return std::nullopt;
        }
        return value;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.emplace_back(".segdl.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "segdl" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "segdl" / "config.yaml");
            }
        }

        return paths;
    }

    // Счётчики и интервалы: ноль и отрицательные значения не допускаются
    static auto validate(const Config& cfg) -> std::optional<std::string> {
        using std::chrono::milliseconds;
        if (cfg.workers && *cfg.workers == 0) return "workers must be positive";
        if (cfg.chunk_size && *cfg.chunk_size == 0) return "chunk_size must be positive";
        if (cfg.segment_attempts && *cfg.segment_attempts <= 0) return "segment_attempts must be positive";
        if (cfg.transfer_retries && *cfg.transfer_retries <= 0) return "transfer_retries must be positive";
        if (cfg.segment_backoff < milliseconds::zero()) return "segment_backoff_ms must not be negative";
        if (cfg.retry_cooldown && *cfg.retry_cooldown < milliseconds::zero())
            return "retry_cooldown_s must not be negative";
        if (cfg.probe_timeout <= milliseconds::zero()) return "probe_timeout_s must be positive";
        if (cfg.connect_timeout <= milliseconds::zero()) return "connect_timeout_s must be positive";
        if (cfg.read_timeout && *cfg.read_timeout <= milliseconds::zero()) return "read_timeout_s must be positive";
        if (cfg.progress_interval <= milliseconds::zero()) return "progress_interval_ms must be positive";
        if (cfg.checkpoint_interval <= milliseconds::zero()) return "checkpoint_interval_ms must be positive";
        return std::nullopt;
    }

    static auto parse_config(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["workers"]) cfg.workers = config["workers"].as<std::uint32_t>();
            if (config["chunk_size"]) cfg.chunk_size = config["chunk_size"].as<std::size_t>();

            if (config["segment_attempts"]) cfg.segment_attempts = config["segment_attempts"].as<int>();
            if (config["segment_backoff_ms"])
                cfg.segment_backoff = std::chrono::milliseconds(config["segment_backoff_ms"].as<long>());
            if (config["transfer_retries"]) cfg.transfer_retries = config["transfer_retries"].as<int>();
            if (config["retry_cooldown_s"])
                cfg.retry_cooldown = std::chrono::seconds(config["retry_cooldown_s"].as<long>());

            if (config["probe_timeout_s"])
                cfg.probe_timeout = std::chrono::seconds(config["probe_timeout_s"].as<long>());
            if (config["connect_timeout_s"])
                cfg.connect_timeout = std::chrono::seconds(config["connect_timeout_s"].as<long>());
            if (config["read_timeout_s"])
                cfg.read_timeout = std::chrono::seconds(config["read_timeout_s"].as<long>());
            if (config["progress_interval_ms"])
                cfg.progress_interval = std::chrono::milliseconds(config["progress_interval_ms"].as<long>());
            if (config["checkpoint_interval_ms"])
                cfg.checkpoint_interval = std::chrono::milliseconds(config["checkpoint_interval_ms"].as<long>());

            if (config["output_dir"]) cfg.output_dir = config["output_dir"].as<std::string>();
            if (config["user_agent"]) cfg.user_agent = config["user_agent"].as<std::string>();
            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["expected_xxh64"]) {
                const auto text = config["expected_xxh64"].as<std::string>();
                cfg.expected_xxh64 = parse_xxh64(text);
                if (!cfg.expected_xxh64) {
                    return std::unexpected(fmt::format("Invalid expected_xxh64 '{}' in {}", text, path.string()));
                }
            }
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["history"]) cfg.history = config["history"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();

            if (auto problem = validate(cfg)) {
                return std::unexpected(fmt::format("{} in {}", *problem, path.string()));
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const YAML::Exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            if (!std::filesystem::exists(path)) continue;
            return parse_config(path);
        }

        // Файл не найден: возвращаем конфиг по умолчанию (не ошибка!)
        return Config{};
    }

    auto load_config_from_path(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        if (!std::filesystem::exists(path)) {
            return std::unexpected(fmt::format("Config file not found: {}", path.string()));
        }
        return parse_config(path);
    }

    [[nodiscard]]
    auto config_from_cli(const segdl::args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.workers = args.threads;
        cfg.chunk_size = args.chunk_size;
        if (!args.output_dir.empty()) cfg.output_dir = args.output_dir;
        if (args.transfer_retries) cfg.transfer_retries = *args.transfer_retries;
        if (args.segment_attempts) cfg.segment_attempts = *args.segment_attempts;
        if (args.retry_cooldown_s) cfg.retry_cooldown = std::chrono::seconds(*args.retry_cooldown_s);
        cfg.verify = args.verify || !args.xxh64.empty();
        if (!args.xxh64.empty()) cfg.expected_xxh64 = parse_xxh64(args.xxh64);
        cfg.progress = !args.no_progress;
        cfg.quiet = args.quiet;
        cfg.history = !args.no_history;
        if (args.verbose) cfg.log_level = "debug";
        return cfg;
    }

} // namespace segdl::infra
