#include "args_parser.hpp"
#include "../../infra/config/config.hpp"

#include <CLI/CLI.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::args_parser {

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"segdl - segmented, resumable HTTP downloader"};

    app.add_option("urls", args.urls, "Resource URLs to download");
    app.add_option("-d,--output-dir", args.output_dir, "Destination directory");
    app.add_option("-o,--output-file", args.output_file, "Explicit output file name (single URL only)");
    app.add_option("--config", args.config_path, "Explicit YAML config file")
        ->check(CLI::ExistingFile);
    app.add_option("-t,--threads", args.threads, "Segments for a fresh transfer")
        ->check(CLI::Range(1u, 64u));
    app.add_option("--chunk-size", args.chunk_size, "Read buffer size in bytes")
        ->check(CLI::PositiveNumber);
    app.add_option("--retries", args.transfer_retries, "Whole-transfer retry budget")
        ->check(CLI::Range(1, 100));
    app.add_option("--segment-attempts", args.segment_attempts, "Attempts per segment before it is reported failed")
        ->check(CLI::Range(1, 100));
    app.add_option("--cooldown", args.retry_cooldown_s, "Seconds to wait before a whole-transfer retry")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--xxh64", args.xxh64, "Expected xxHash64 of the merged file (hex)")
        ->check([](const std::string& value) -> std::string {
            return infra::parse_xxh64(value) ? std::string{} : "not a 64-bit hex digest";
        });
    app.add_flag("--verify", args.verify, "Log the xxHash64 of the merged file");
    app.add_flag("--no-progress", args.no_progress, "Disable the progress bar");
    app.add_flag("-q,--quiet", args.quiet, "Only print errors");
    app.add_flag("-v,--verbose", args.verbose, "Debug logging");
    app.add_flag("--no-history", args.no_history, "Do not record the transfer in the history ledger");

    auto* list = app.add_flag("--list", args.list_resumable, "List resumable transfers in the output directory");
    auto* history = app.add_flag("--history", args.show_history, "Print the transfer history ledger");
    auto* discard = app.add_option("--discard", args.discard_url, "Discard resume state for URL");
    list->excludes(history)->excludes(discard);
    history->excludes(discard);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    const bool maintenance = args.list_resumable || args.show_history || !args.discard_url.empty();
    if (!maintenance && args.urls.empty()) {
        spdlog::error("At least one URL is required");
        fmt::print("{}", app.help());
        return std::nullopt;
    }
    if (!args.output_file.empty() && args.urls.size() > 1) {
        spdlog::error("--output-file can only be used with a single URL");
        return std::nullopt;
    }

    return args;
}

} // namespace segdl::args_parser
