#include "xxhash_verifier.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>

namespace segdl::infra {

namespace {

struct StateDeleter {
    void operator()(XXH64_state_t* state) const noexcept { XXH64_freeState(state); }
};

} // namespace

auto XXHashVerifier::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::InvalidPath,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, StateDeleter> state{XXH64_createState()};
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }
    XXH64_reset(state.get(), 0);

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::Unknown,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto XXHashVerifier::verify_digest(const std::filesystem::path& path, std::uint64_t expected)
    -> std::expected<XXH64_hash_t, Error>
{
    auto hash = hash_file(path);
    if (!hash) {
        return hash;
    }
    if (*hash != expected) {
        return std::unexpected(make_error(ErrorCode::ChecksumMismatch,
            fmt::format("xxh64 mismatch for {}: expected {}, got {}",
                        path.string(), to_hex(expected), to_hex(*hash))));
    }
    return hash;
}

auto XXHashVerifier::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<std::uint64_t>(hash));
}

} // namespace segdl::infra
