#include <iostream>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/http_transfer/http_transfer.hpp"
#include "extensions/history.hpp"
#include "extensions/resumer.hpp"
#include "net/curl_session.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>

using GIT = segdl::build_info::GitInfo;
using ARGS = segdl::args_parser::CLIArgs;
using CONFIG = segdl::infra::Config;

constexpr auto load_from_cli = segdl::infra::config_from_cli;
constexpr auto args_parser = segdl::args_parser::parse_args;
constexpr auto git = segdl::build_info::get_git_info();

static auto
out_git_verse(const GIT& info)
-> void {
    spdlog::debug("Git branch: {}", info.branch);
    spdlog::debug("Git commit: {}{}", info.commit_short, info.dirty ? " (dirty)" : "");
    spdlog::debug("Build timestamp (UTC): {}", info.timestamp);
}

static auto
out_args_verse(const ARGS& args, const CONFIG& config)
-> void {
    spdlog::debug("URLs: {}", args.urls);
    spdlog::debug("Output dir: {}", config.effective_output_dir().string());
    spdlog::debug("Workers: {}", config.workers ? fmt::to_string(*config.workers) : "default");
    spdlog::debug("Transfer retries: {}, segment attempts: {}", config.effective_transfer_retries(),
                  config.effective_segment_attempts());
    spdlog::debug("Verify: {}", config.verify ? "yes" : "no");
}

[[nodiscard]]
static auto
load_config(const ARGS& args)
-> std::expected<CONFIG, std::string> {
    // 1. Загрузить из файла
    auto config_res = args.config_path.empty()
        ? segdl::infra::load_config_from_file()
        : segdl::infra::load_config_from_path(args.config_path);
    if (!config_res) {
        return config_res;
    }

    // 2. Переопределить из CLI
    auto config = *config_res;
    config.merge_with(load_from_cli(args));
    return config;
}

static auto
apply_log_level(const CONFIG& config)
-> void {
    if (config.quiet) {
        spdlog::set_level(spdlog::level::warn);
        return;
    }
    const auto name = config.effective_log_level();
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level '{}', using info", name);
        level = spdlog::level::info;
    }
    spdlog::set_level(level);
}

[[nodiscard]]
static auto
list_resumable(const std::filesystem::path& dir)
-> int {
    const auto records = segdl::extensions::list_resumable(dir);
    if (records.empty()) {
        fmt::print("No resumable transfers in {}\n", dir.string());
        return 0;
    }
    for (const auto& [path, record] : records) {
        std::uint64_t done = 0;
        for (const auto& [index, bytes] : record.parts) {
            done += bytes;
        }
        const double percent = record.file_size > 0
            ? 100.0 * static_cast<double>(done) / static_cast<double>(record.file_size) : 0.0;
        fmt::print("{}  {:.1f}%  {} parts  {}\n",
                   record.filename, percent, record.original_workers, record.url);
    }
    return 0;
}

[[nodiscard]]
static auto
discard(const std::filesystem::path& dir, const std::string& url, bool history_enabled)
-> int {
    std::size_t removed = 0;
    for (const auto& [path, record] : segdl::extensions::list_resumable(dir)) {
        if (record.url != url) {
            continue;
        }
        const auto request = segdl::core::TransferRequest::make(record.url, dir, 1, record.filename);
        segdl::extensions::ResumeStore store(request);
        store.clear();
        ++removed;
        spdlog::info("Discarded resume data: {}", path.string());
    }

    if (history_enabled) {
        segdl::extensions::TransferHistory history(segdl::extensions::TransferHistory::default_path(dir));
        if (auto res = history.load(); !res) {
            spdlog::warn("History not updated: {}", res.error().message);
        } else if (history.find(url)) {
            history.forget(url);
            if (auto saved = history.save(); !saved) {
                spdlog::warn("History not updated: {}", saved.error().message);
            }
        }
    }

    if (removed == 0) {
        spdlog::warn("No resume data for {}", url);
        return 1;
    }
    return 0;
}

[[nodiscard]]
static auto
show_history(const std::filesystem::path& dir)
-> int {
    segdl::extensions::TransferHistory history(segdl::extensions::TransferHistory::default_path(dir));
    if (auto res = history.load(); !res) {
        spdlog::error("{}", res.error().message);
        return res.error().to_exit_code();
    }
    history.print();
    return 0;
}

[[nodiscard]]
static auto
make_engine_options(const CONFIG& config)
-> segdl::core::EngineOptions {
    segdl::core::EngineOptions options;
    options.segment_retry.max_attempts = config.effective_segment_attempts();
    options.segment_retry.initial_delay = config.segment_backoff;
    options.transfer_retry.budget = config.effective_transfer_retries();
    options.transfer_retry.cooldown = config.effective_retry_cooldown();
    options.poll_interval = config.progress_interval;
    options.checkpoint_interval = config.checkpoint_interval;
    options.verify = config.verify;
    options.expected_xxh64 = config.expected_xxh64;
    return options;
}

[[nodiscard]]
static auto
make_session_options(const CONFIG& config)
-> segdl::net::SessionOptions {
    segdl::net::SessionOptions options;
    options.probe_timeout = config.probe_timeout;
    options.connect_timeout = config.connect_timeout;
    options.read_timeout = config.effective_read_timeout();
    options.user_agent = config.user_agent;
    if (config.chunk_size) {
        options.buffer_size = *config.chunk_size;
    }
    return options;
}

static auto
record_history(const CONFIG& config,
               const std::string& url,
               const segdl::core::TransferResult& result,
               const segdl::infra::ProgressMonitor& monitor)
-> void {
    if (!config.history) {
        return;
    }
    const auto dir = config.effective_output_dir();
    segdl::extensions::TransferHistory history(segdl::extensions::TransferHistory::default_path(dir));
    if (auto res = history.load(); !res) {
        spdlog::warn("History not updated: {}", res.error().message);
        return;
    }

    segdl::extensions::HistoryEntry entry;
    entry.url = url;
    entry.destination = result.destination.string();
    entry.timestamp = segdl::extensions::current_timestamp();
    if (result.success) {
        entry.percent = 100.0;
        entry.status = "completed";
    } else {
        const auto last = monitor.last_event();
        entry.percent = last && last->percent ? *last->percent : 0.0;
        entry.status = result.paused ? "paused" : "failed";
    }
    history.record(std::move(entry), result.success);

    if (auto res = history.save(); !res) {
        spdlog::warn("History not updated: {}", res.error().message);
    }
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        segdl::infra::CancellationToken cancel;
        segdl::infra::install_signal_handler(cancel);

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        auto config_res = load_config(args);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        const auto config = *config_res;
        apply_log_level(config);

        out_git_verse(git);
        out_args_verse(args, config);

        const auto output_dir = config.effective_output_dir();
        if (args.list_resumable) {
            return list_resumable(output_dir);
        }
        if (args.show_history) {
            return show_history(output_dir);
        }
        if (!args.discard_url.empty()) {
            return discard(output_dir, args.discard_url, config.history);
        }

        const auto engine_options = make_engine_options(config);
        const auto sessions = segdl::net::CurlSession::factory(make_session_options(config));
        const auto workers = config.workers.value_or(8);

        int exit_code = 0;
        for (const auto& url : args.urls) {
            auto request = segdl::core::TransferRequest::make(
                url, output_dir, workers,
                args.output_file.empty() ? std::nullopt : std::optional<std::string>(args.output_file));

            segdl::infra::ProgressMonitor monitor(config.progress, config.quiet);
            segdl::core::HttpTransfer transfer(std::move(request), engine_options, sessions, cancel);
            transfer.subscribe(monitor.observer());

            auto result = transfer.start();
            monitor.finish();
            record_history(config, url, result, monitor);

            if (result.success) {
                spdlog::info("Saved to {}", result.destination.string());
                continue;
            }

            exit_code = result.error ? result.error->to_exit_code() : 1;
            if (result.paused) {
                spdlog::info("Run the same command again to resume");
                break;
            }
        }

        segdl::infra::remove_signal_handler();
        return exit_code;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
