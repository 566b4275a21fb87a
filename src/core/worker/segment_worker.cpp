#include "segment_worker.hpp"
#include "../../adapters/fs.hpp"

#include <algorithm>
#include <fstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::core {

SegmentWorker::SegmentWorker(std::uint32_t index,
                             const TransferRequest& request,
                             const TransferPlan& plan,
                             net::SessionPtr session,
                             SharedProgress& progress,
                             infra::CancellationToken cancel,
                             infra::RetryPolicy retry,
                             CheckpointFn checkpoint)
    : index_(index)
    , request_(request)
    , plan_(plan)
    , session_(std::move(session))
    , progress_(progress)
    , cancel_(std::move(cancel))
    , retry_(retry)
    , checkpoint_(std::move(checkpoint))
{}

auto SegmentWorker::run() -> SegmentOutcome {
    auto res = infra::with_retry([this](int attempt) {
        auto result = attempt_();
        if (!result && result.error().is_transient()) {
            spdlog::warn("Part {} attempt {} failed: {}", index_, attempt + 1, result.error().message);
        }
        return result;
    }, retry_, &cancel_);

    if (res) {
        spdlog::info("Part {} completed", index_);
        return SegmentOutcome::Completed;
    }

    if (cancel_.requested() || res.error().code == infra::ErrorCode::Interrupted) {
        spdlog::debug("Part {} stopped on shutdown request", index_);
        return SegmentOutcome::Cancelled;
    }

    progress_.record_error();
    spdlog::error("Part {} failed after {} attempts: {}", index_, retry_.max_attempts, res.error().message);
    return SegmentOutcome::Failed;
}

auto SegmentWorker::sync_part_file_(const std::filesystem::path& path,
                                    std::uint64_t downloaded) const -> infra::VoidResult
{
    const auto on_disk = adapters::fs::file_size(path);
    if (on_disk < 0) {
        if (downloaded != 0) {
            return std::unexpected(infra::make_error(infra::ErrorCode::Corruption,
                                 fmt::format("Part file {} vanished with {} bytes recorded", path.string(), downloaded)));
        }
        return {};
    }

    const auto size = static_cast<std::uint64_t>(on_disk);
    if (size == downloaded) {
        return {};
    }
    if (size < downloaded) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Corruption,
                             fmt::format("Part file {} is shorter ({}) than recorded ({})", path.string(), size, downloaded)));
    }

    // Хвост, не учтённый в счётчике (обрыв посреди записи), отбрасываем
    std::error_code ec;
    std::filesystem::resize_file(path, downloaded, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot truncate {}: {}", path.string(), ec.message())));
    }
    spdlog::debug("Part {} truncated from {} to {} bytes", index_, size, downloaded);
    return {};
}

auto SegmentWorker::attempt_() -> infra::VoidResult {
    if (cancel_.requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "Shutdown requested"));
    }

    const Segment segment = progress_.segment(index_);
    if (segment.complete()) {
        return {};
    }

    const auto parts_dir = request_.parts_dir();
    if (auto res = adapters::fs::ensure_directory(parts_dir); !res) {
        return res;
    }
    const auto path = part_file(parts_dir, index_);
    if (auto res = sync_part_file_(path, segment.downloaded); !res) {
        return res;
    }

    net::GetRequest request{request_.url, std::nullopt};
    std::uint64_t skip = 0;
    if (plan_.ranges_supported && segment.span) {
        request.range = net::ByteRange{segment.span->first + segment.downloaded, segment.span->last};
    } else if (plan_.ranges_supported && segment.downloaded > 0) {
        request.range = net::ByteRange{segment.downloaded, std::nullopt};
    } else {
        // Без Range сервер отдаёт ресурс целиком: уже записанный префикс пропускаем
        skip = segment.downloaded;
    }
    const bool ranged = request.range.has_value();

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot open part file {}", path.string())));
    }

    std::optional<std::uint64_t> remaining = segment.remaining();
    std::optional<infra::Error> status_error;
    bool write_failed = false;

    net::ResponseHandler handler;
    handler.on_status = [&](long status) {
        const long expected = ranged ? 206 : 200;
        if (status == expected) {
            return true;
        }
        if (ranged && status == 200) {
            status_error = infra::make_error(infra::ErrorCode::RangeViolation,
                fmt::format("Server violated range request for part {}", index_));
        } else {
            status_error = infra::make_error(infra::ErrorCode::HttpStatus,
                fmt::format("Part {} failed: HTTP {}", index_, status));
        }
        return false;
    };
    handler.on_body = [&](std::string_view chunk) {
        if (cancel_.requested()) {
            return false;
        }
        if (skip > 0) {
            const auto n = std::min<std::uint64_t>(skip, chunk.size());
            chunk.remove_prefix(static_cast<std::size_t>(n));
            skip -= n;
            if (chunk.empty()) {
                return true;
            }
        }
        if (remaining && chunk.size() > *remaining) {
            spdlog::debug("Part {}: server sent {} bytes past the range", index_, chunk.size() - *remaining);
            chunk = chunk.substr(0, static_cast<std::size_t>(*remaining));
        }

        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        out.flush();
        if (!out) {
            write_failed = true;
            return false;
        }

        progress_.add_bytes(index_, chunk.size());
        if (checkpoint_) {
            checkpoint_();
        }

        if (remaining) {
            *remaining -= chunk.size();
            return *remaining > 0;
        }
        return true;
    };

    auto response = session_->get(request, handler);
    out.close();

    if (!response) {
        return std::unexpected(std::move(response.error()));
    }
    if (response->rejected) {
        return std::unexpected(status_error.value_or(infra::make_error(infra::ErrorCode::HttpStatus,
                             fmt::format("Part {} rejected: HTTP {}", index_, response->status))));
    }
    if (write_failed) {
        return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                             fmt::format("Cannot write part file {}", path.string())));
    }
    if (remaining && *remaining == 0) {
        return {};
    }
    if (cancel_.requested()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted, "Shutdown requested"));
    }
    if (remaining) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SegmentTransient,
                             fmt::format("Part {} body ended early, {} bytes missing", index_, *remaining)));
    }
    if (skip > 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SegmentTransient,
                             fmt::format("Part {} body shorter than data already on disk", index_)));
    }

    // Размер неизвестен: сегмент закончен, когда сервер закрыл тело
    progress_.mark_finished(index_);
    return {};
}

} // namespace segdl::core
