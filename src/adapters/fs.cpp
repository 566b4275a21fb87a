#include "fs.hpp"

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

#ifdef __linux__
    #include <liburing.h>
#endif

namespace segdl::adapters::fs {

namespace {

struct FdCloser {
    int fd = -1;
    ~FdCloser() { if (fd >= 0) ::close(fd); }
};

auto errno_message(std::string_view what, const std::filesystem::path& path) -> std::string {
    return fmt::format("{} {}: {}", what, path.string(), std::strerror(errno));
}

// write() может писать частями
auto write_all(int fd, const char* data, std::size_t size) -> bool {
    while (size > 0) {
        const ssize_t written = ::write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<std::size_t>(written);
    }
    return true;
}

// =============== Buffered I/O ===============
auto append_buffered(int src_fd, int dst_fd, const std::filesystem::path& src) -> infra::VoidResult {
    constexpr std::size_t buffer_size = 64 * 1024;
    std::vector<char> buffer(buffer_size);
    for (;;) {
        const ssize_t n = ::read(src_fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, errno_message("Read failed for", src)));
        }
        if (n == 0) break;
        if (!write_all(dst_fd, buffer.data(), static_cast<std::size_t>(n))) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                 fmt::format("Write failed while appending {}: {}", src.string(), std::strerror(errno))));
        }
    }
    return {};
}

// =============== Memory-mapped I/O ===============
auto append_mmap(int src_fd, int dst_fd, const std::filesystem::path& src, std::size_t size) -> infra::VoidResult {
    void* src_map = ::mmap(nullptr, size, PROT_READ, MAP_PRIVATE, src_fd, 0);
    if (src_map == MAP_FAILED) {
        spdlog::debug("mmap failed for {}, falling back to buffered", src.string());
        return append_buffered(src_fd, dst_fd, src);
    }

    const bool ok = write_all(dst_fd, static_cast<const char*>(src_map), size);
    ::munmap(src_map, size);

    if (!ok) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                             fmt::format("Incomplete write while appending {}", src.string())));
    }
    return {};
}

#ifdef __linux__
// =============== io_uring ===============
constexpr unsigned RING_SIZE = 8;
constexpr std::size_t URING_CHUNK = 4 * 1024 * 1024; // 4 MB

struct RingGuard {
    io_uring ring{};
    bool ready = false;
    ~RingGuard() { if (ready) io_uring_queue_exit(&ring); }
};

// Одна операция: подготовить, отправить, дождаться результата
template<typename Prep>
auto uring_roundtrip(io_uring& ring, Prep&& prep) -> int {
    io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    if (!sqe) return -EBUSY;
    prep(sqe);
    if (const int rc = io_uring_submit(&ring); rc < 0) return rc;

    io_uring_cqe* cqe = nullptr;
    if (const int rc = io_uring_wait_cqe(&ring, &cqe); rc < 0) return rc;
    const int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);
    return res;
}

auto append_uring(int src_fd, int dst_fd, const std::filesystem::path& src) -> infra::VoidResult {
    RingGuard guard;
    if (io_uring_queue_init(RING_SIZE, &guard.ring, 0) < 0) {
        return append_buffered(src_fd, dst_fd, src); // fallback
    }
    guard.ready = true;

    std::unique_ptr<char, decltype(&std::free)> buffer{
        static_cast<char*>(std::aligned_alloc(4096, URING_CHUNK)), &std::free};
    if (!buffer) {
        return append_buffered(src_fd, dst_fd, src);
    }

    off_t dst_offset = ::lseek(dst_fd, 0, SEEK_END);
    if (dst_offset < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "lseek failed on merge target"));
    }

    off_t src_offset = 0;
    for (;;) {
        const int read = uring_roundtrip(guard.ring, [&](io_uring_sqe* sqe) {
            io_uring_prep_read(sqe, src_fd, buffer.get(), URING_CHUNK, static_cast<__u64>(src_offset));
        });
        if (read < 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                 fmt::format("io_uring read failed for {}: {}", src.string(), std::strerror(-read))));
        }
        if (read == 0) break;

        int done = 0;
        while (done < read) {
            const int written = uring_roundtrip(guard.ring, [&](io_uring_sqe* sqe) {
                io_uring_prep_write(sqe, dst_fd, buffer.get() + done,
                                    static_cast<unsigned>(read - done), static_cast<__u64>(dst_offset));
            });
            if (written <= 0) {
                return std::unexpected(infra::make_error(infra::ErrorCode::Unknown,
                                     fmt::format("io_uring write failed while appending {}", src.string())));
            }
            done += written;
            dst_offset += written;
        }
        src_offset += read;
    }

    // Позиционные записи не двигают позицию файла
    if (::lseek(dst_fd, dst_offset, SEEK_SET) < 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "lseek failed on merge target"));
    }
    return {};
}
#endif

} // namespace

auto select_strategy(std::uintmax_t file_size) -> AppendStrategy {
    if (file_size < 1'000'000) return AppendStrategy::Buffered;      // < 1 MB
    if (file_size < 100'000'000) return AppendStrategy::MMap;        // < 100 MB
    return AppendStrategy::Uring;                                    // >= 100 MB
}

auto append_file(
    const std::filesystem::path& src,
    int dst_fd,
    AppendStrategy strategy
) -> infra::VoidResult {
    FdCloser src_fd{::open(src.c_str(), O_RDONLY | O_CLOEXEC)};
    if (src_fd.fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath, errno_message("Cannot open", src)));
    }

    struct stat sb{};
    if (::fstat(src_fd.fd, &sb) == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, errno_message("fstat failed for", src)));
    }
    if (sb.st_size == 0) {
        return {};
    }

    switch (strategy) {
        case AppendStrategy::MMap:
            return append_mmap(src_fd.fd, dst_fd, src, static_cast<std::size_t>(sb.st_size));
        case AppendStrategy::Uring:
#ifdef __linux__
            return append_uring(src_fd.fd, dst_fd, src);
#endif
        case AppendStrategy::Buffered:
        default:
            return append_buffered(src_fd.fd, dst_fd, src);
    }
}

auto concat_files(
    const std::vector<std::filesystem::path>& parts,
    const std::filesystem::path& dst
) -> infra::VoidResult {
    FdCloser dst_fd{::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (dst_fd.fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied, errno_message("Cannot create", dst)));
    }

    for (const auto& part : parts) {
        std::error_code ec;
        const auto size = std::filesystem::file_size(part, ec);
        auto res = append_file(part, dst_fd.fd, ec ? AppendStrategy::Buffered : select_strategy(size));
        if (!res) {
            ::close(dst_fd.fd);
            dst_fd.fd = -1;
            remove_quietly(dst);
            return res;
        }
    }

    // Без fsync склейка не считается сохранённой: сегменты удалять нельзя
    if (::fsync(dst_fd.fd) != 0) {
        auto err = infra::make_error(infra::ErrorCode::Persistence, errno_message("fsync failed for", dst));
        ::close(dst_fd.fd);
        dst_fd.fd = -1;
        remove_quietly(dst);
        return std::unexpected(std::move(err));
    }
    return {};
}

auto atomic_write(
    const std::filesystem::path& target,
    std::string_view content
) -> infra::VoidResult {
    auto temp = target;
    temp += ".tmp";

    FdCloser fd{::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644)};
    if (fd.fd == -1) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence, errno_message("Cannot create", temp)));
    }
    if (!write_all(fd.fd, content.data(), content.size())) {
        auto err = infra::make_error(infra::ErrorCode::Persistence, errno_message("Cannot write", temp));
        remove_quietly(temp);
        return std::unexpected(std::move(err));
    }
    if (::fsync(fd.fd) != 0) {
        auto err = infra::make_error(infra::ErrorCode::Persistence, errno_message("fsync failed for", temp));
        remove_quietly(temp);
        return std::unexpected(std::move(err));
    }
    ::close(fd.fd);
    fd.fd = -1;

    std::error_code ec;
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        remove_quietly(temp);
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
                             fmt::format("Cannot replace {}: {}", target.string(), ec.message())));
    }
    return {};
}

auto ensure_directory(const std::filesystem::path& dir) -> infra::VoidResult {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot create directory {}: {}", dir.string(), ec.message())));
    }
    return {};
}

auto file_size(const std::filesystem::path& path) -> std::int64_t {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) return -1;
    return static_cast<std::int64_t>(size);
}

auto remove_quietly(const std::filesystem::path& path) -> bool {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        spdlog::warn("Could not remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

auto is_writable_directory(const std::filesystem::path& dir) -> bool {
    const auto probe = dir / ".segdl_write_probe";
    {
        std::ofstream out(probe, std::ios::binary);
        if (!out || !(out << "test")) {
            return false;
        }
    }
    remove_quietly(probe);
    return true;
}

} // namespace segdl::adapters::fs
