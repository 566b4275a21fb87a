#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace segdl::infra {

// Контрольные суммы xxHash64 для проверки склеенного файла
class XXHashVerifier {
public:
    // Вычисляет xxHash64 файла (seed = 0)
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    // Сверяет хеш файла с ожидаемым; несовпадение: ChecksumMismatch
    static auto verify_digest(const std::filesystem::path& path, std::uint64_t expected)
        -> std::expected<XXH64_hash_t, Error>;

    [[nodiscard]] static auto to_hex(XXH64_hash_t hash) -> std::string;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace segdl::infra
