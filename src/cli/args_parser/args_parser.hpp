#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace segdl::args_parser {

struct CLIArgs
{
    std::vector<std::string> urls;              // позиционные аргументы
    std::string output_dir;                     // -d, --output-dir
    std::string output_file;                    // -o, --output-file (только для одного URL)
    std::string config_path;                    // --config
    std::optional<std::uint32_t> threads;       // -t, --threads=N
    std::optional<std::size_t> chunk_size;      // --chunk-size=BYTES
    std::optional<int> transfer_retries;        // --retries=N
    std::optional<int> segment_attempts;        // --segment-attempts=N
    std::optional<long> retry_cooldown_s;       // --cooldown=SECONDS
    std::string xxh64;                          // --xxh64=HEX
    bool verify{false};                         // --verify
    bool no_progress{false};                    // --no-progress
    bool quiet{false};                          // -q, --quiet
    bool verbose{false};                        // -v, --verbose
    bool no_history{false};                     // --no-history
    bool list_resumable{false};                 // --list
    bool show_history{false};                   // --history
    std::string discard_url;                    // --discard=URL
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// nullopt означает --help или ошибку разбора (сообщение уже выведено CLI11).
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace segdl::args_parser
