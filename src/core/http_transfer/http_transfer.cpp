#include "http_transfer.hpp"
#include "../merger/merger.hpp"
#include "../planner/segment_planner.hpp"
#include "../prober/capability_prober.hpp"
#include "../worker/segment_worker.hpp"
#include "../../adapters/fs.hpp"
#include "../../infra/hash/xxhash_verifier.hpp"
#include "../../infra/thread_pool/thread_pool.hpp"

#include <algorithm>
#include <future>
#include <thread>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::core {

namespace {

auto unix_now() -> double {
    return std::chrono::duration<double>(std::chrono::system_clock::now().time_since_epoch()).count();
}

auto all_ready(const std::vector<std::future<SegmentOutcome>>& futures) -> bool {
    return std::all_of(futures.begin(), futures.end(), [](const auto& f) {
        return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    });
}

} // namespace

HttpTransfer::HttpTransfer(TransferRequest request,
                           EngineOptions options,
                           net::SessionFactory sessions,
                           infra::CancellationToken cancel)
    : request_(std::move(request))
    , options_(std::move(options))
    , sessions_(std::move(sessions))
    , cancel_(std::move(cancel))
    , store_(request_)
{}

HttpTransfer::~HttpTransfer() = default;

auto HttpTransfer::start() -> TransferResult {
    bool expected = false;
    if (!active_.compare_exchange_strong(expected, true)) {
        TransferResult result;
        result.destination = request_.destination();
        result.error = infra::make_error(infra::ErrorCode::InvalidArgument, "Transfer is already running");
        return result;
    }

    auto result = run_();
    active_.store(false);
    return result;
}

void HttpTransfer::pause() {
    spdlog::warn("Graceful shutdown initiated...");
    cancel_.request();
}

auto HttpTransfer::resume() -> TransferResult {
    cancel_.reset();
    spdlog::info("Download resumed: {}", request_.filename);
    return start();
}

void HttpTransfer::subscribe(infra::ProgressObserver observer) {
    std::lock_guard lock(observers_mutex_);
    observers_.push_back(std::move(observer));
}

auto HttpTransfer::plan() const -> std::optional<TransferPlan> {
    std::lock_guard lock(plan_mutex_);
    return plan_;
}

auto HttpTransfer::segments() const -> std::vector<Segment> {
    std::lock_guard lock(plan_mutex_);
    if (!progress_) {
        return {};
    }
    return progress_->snapshot().segments;
}

auto HttpTransfer::run_() -> TransferResult {
    started_ = std::chrono::steady_clock::now();
    attempts_ = 0;
    state_ = TransferState::Planning;

    TransferResult result;
    result.destination = request_.destination();
    spdlog::info("Starting download: {}", request_.filename);

    if (auto res = adapters::fs::ensure_directory(request_.output_dir); !res) {
        return fail_(std::move(result), std::move(res.error()));
    }

    auto session = sessions_();
    auto segments = prepare_(*session);
    if (!segments) {
        return fail_(std::move(result), std::move(segments.error()));
    }

    {
        std::lock_guard lock(plan_mutex_);
        progress_ = std::make_shared<SharedProgress>(std::move(*segments), plan_->total_size);
    }
    initial_bytes_ = progress_->downloaded();
    speed_.reset(initial_bytes_, std::chrono::steady_clock::now());

    if (plan_->resumable() && !store_.exists()) {
        checkpoint_(true); // запись создаётся после первого удачного probe
    }

    int retries_left = std::max(1, options_.transfer_retry.budget);
    for (;;) {
        if (cancel_.requested()) {
            return pause_(std::move(result));
        }

        progress_->clear_errors();
        const auto pending = progress_->incomplete();
        if (!pending.empty()) {
            ++attempts_;
            state_ = TransferState::Running;
            spdlog::info("Downloading {} of {} part(s)", pending.size(), plan_->original_workers);
            run_workers_(pending, session);

            if (cancel_.requested()) {
                return pause_(std::move(result));
            }
        }
        emit_progress_();

        const auto errors = progress_->error_count();
        if (errors == 0 && progress_->all_complete()) {
            break;
        }

        --retries_left;
        if (retries_left <= 0) {
            checkpoint_(true);
            spdlog::error("Maximum retry attempts reached. Download failed.");
            return fail_(std::move(result), infra::make_error(infra::ErrorCode::RetryExhausted,
                fmt::format("{} part(s) still failing after {} attempts", errors, attempts_)));
        }

        state_ = TransferState::Retrying;
        checkpoint_(true);
        spdlog::warn("Temporary failure in {} parts. Retrying in {} seconds ({} retries left)...",
                     errors,
                     std::chrono::duration_cast<std::chrono::seconds>(options_.transfer_retry.cooldown).count(),
                     retries_left);
        if (cancel_.sleep_for(options_.transfer_retry.cooldown)) {
            return pause_(std::move(result));
        }
        session = sessions_(); // новая сессия: новый пул соединений
    }

    state_ = TransferState::Merging;
    const auto snapshot = progress_->snapshot();
    if (auto merged = merge_segments(snapshot.segments, request_.parts_dir(), request_.destination(), store_); !merged) {
        spdlog::error("Download incomplete. Resume the download later or check network connection.");
        return fail_(std::move(result), std::move(merged.error()));
    }

    if (options_.expected_xxh64) {
        auto digest = infra::XXHashVerifier::verify_digest(request_.destination(), *options_.expected_xxh64);
        if (!digest) {
            return fail_(std::move(result), std::move(digest.error()));
        }
        spdlog::info("xxh64 verified: {}", infra::XXHashVerifier::to_hex(*digest));
    } else if (options_.verify) {
        auto digest = infra::XXHashVerifier::hash_file(request_.destination());
        if (!digest) {
            return fail_(std::move(result), std::move(digest.error()));
        }
        spdlog::info("xxh64: {}", infra::XXHashVerifier::to_hex(*digest));
    }

    state_ = TransferState::Completed;
    result.success = true;
    fill_stats_(result);

    const double seconds = static_cast<double>(result.stats.elapsed.count()) / 1000.0;
    const double mb = static_cast<double>(result.stats.bytes_downloaded) / 1024.0 / 1024.0;
    spdlog::info("Download Statistics:");
    spdlog::info("- Time elapsed: {:.2f}s", seconds);
    spdlog::info("- Downloaded: {:.2f} MB", mb);
    spdlog::info("- Avg speed: {:.2f} MB/s", seconds > 0 ? mb / seconds : 0.0);
    return result;
}

auto HttpTransfer::prepare_(net::HttpSession& session) -> infra::Result<std::vector<Segment>> {
    auto caps = probe(session, request_.url);
    if (!caps) {
        return std::unexpected(std::move(caps.error()));
    }

    TransferPlan plan;
    plan.ranges_supported = caps->ranges_supported;
    plan.total_size = caps->total_size;
    if (!plan.total_size && request_.size_hint) {
        spdlog::info("Using externally provided size: {} bytes", *request_.size_hint);
        plan.total_size = request_.size_hint;
    }

    auto record = store_.load(request_);

    std::vector<Segment> segments;
    if (!plan.resumable()) {
        // Границы сегментов не вычислить: один поток, без resume-записи
        if (record || store_.exists()) {
            spdlog::info("Clearing incompatible resume data");
        }
        store_.clear();
        plan.workers = plan.original_workers = 1;
        segments = plan_single_stream(plan.total_size);
        spdlog::info("Resume data is not kept: {}",
                     plan.total_size ? "server has no range support" : "file size is unknown");
    } else {
        const auto total = *plan.total_size;
        if (record && record->file_size != total) {
            spdlog::warn("Remote size changed ({} -> {}), discarding resume data", record->file_size, total);
            store_.clear();
            record.reset();
        }
        if (record && effective_worker_count(total, record->original_workers) != record->original_workers) {
            spdlog::warn("Resume data has {} parts for {} bytes, discarding", record->original_workers, total);
            store_.clear();
            record.reset();
        }

        if (record) {
            plan.workers = plan.original_workers = record->original_workers;
            if (request_.workers != record->original_workers) {
                spdlog::info("Keeping original partition of {} parts (requested {})",
                             record->original_workers, request_.workers);
            }
            segments = rehydrate_(*record, total);
        } else {
            store_.clear(); // файлы сегментов без записи нам не принадлежат
            plan.workers = plan.original_workers = effective_worker_count(total, request_.workers);
            segments = plan_segments(total, plan.workers);
        }
    }

    spdlog::info("Plan: size={}, ranges={}, parts={}",
                 plan.total_size ? fmt::to_string(*plan.total_size) : "unknown",
                 plan.ranges_supported ? "yes" : "no",
                 plan.original_workers);

    std::lock_guard lock(plan_mutex_);
    plan_ = plan;
    return segments;
}

auto HttpTransfer::rehydrate_(const ResumeRecord& record, std::uint64_t total_size) -> std::vector<Segment> {
    auto segments = plan_segments(total_size, record.original_workers);
    std::uint64_t restored = 0;

    for (auto& segment : segments) {
        const auto it = record.parts.find(segment.index);
        const std::uint64_t recorded = it == record.parts.end() ? 0 : it->second;
        const auto path = part_file(request_.parts_dir(), segment.index);
        const auto on_disk = adapters::fs::file_size(path);

        if (on_disk < 0) {
            if (recorded > 0) {
                spdlog::warn("Missing part file {}, resetting progress", segment.index);
            }
            segment.downloaded = 0;
            continue;
        }

        // Файл сегмента: источник истины: чекпоинт мог отстать от записи
        auto size = static_cast<std::uint64_t>(on_disk);
        if (size > *segment.expected_size) {
            std::error_code ec;
            std::filesystem::resize_file(path, *segment.expected_size, ec);
            if (ec) {
                spdlog::warn("Cannot trim part file {}: {}, restarting it", segment.index, ec.message());
                adapters::fs::remove_quietly(path);
                size = 0;
            } else {
                size = *segment.expected_size;
            }
        }
        if (size < recorded) {
            spdlog::warn("Part {} holds {} bytes, {} were recorded", segment.index, size, recorded);
        }
        segment.downloaded = size;
        restored += size;
    }

    spdlog::info("Resuming download: {} bytes already downloaded", restored);
    return segments;
}

void HttpTransfer::run_workers_(const std::vector<std::uint32_t>& pending, const net::SessionPtr& session) {
    // Воркеры объявлены до пула: пул джойнит потоки раньше, чем они разрушатся
    std::vector<std::unique_ptr<SegmentWorker>> workers;
    workers.reserve(pending.size());
    for (const auto index : pending) {
        workers.push_back(std::make_unique<SegmentWorker>(
            index, request_, *plan_, session, *progress_, cancel_, options_.segment_retry,
            [this] { checkpoint_(false); }));
    }

    infra::ThreadPool pool{pending.size()};
    std::vector<std::future<SegmentOutcome>> futures;
    futures.reserve(workers.size());
    for (auto& worker : workers) {
        futures.push_back(pool.enqueue([w = worker.get()] { return w->run(); }));
    }

    while (!all_ready(futures)) {
        if (cancel_.requested()) {
            // Ждём воркеры ограниченное время; заблокированный read
            // всё равно дочитает свой кусок до проверки флага
            const auto deadline = std::chrono::steady_clock::now() + options_.pause_grace;
            while (!all_ready(futures) && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            if (!all_ready(futures)) {
                spdlog::warn("Some parts are still blocked on network reads; saving state before they exit");
            }
            checkpoint_(true);
            return;
        }

        const auto it = std::find_if(futures.begin(), futures.end(), [](const auto& f) {
            return f.wait_for(std::chrono::seconds(0)) != std::future_status::ready;
        });
        if (it != futures.end()) {
            it->wait_for(options_.poll_interval);
        }
        emit_progress_();
    }

    std::size_t failed = 0;
    for (auto& future : futures) {
        if (future.get() == SegmentOutcome::Failed) {
            ++failed;
        }
    }
    spdlog::debug("Workers finished: {} ok, {} failed", futures.size() - failed, failed);
}

auto HttpTransfer::make_record_(const SharedProgress::Snapshot& snapshot) const -> ResumeRecord {
    ResumeRecord record;
    record.url = request_.url;
    record.filename = request_.filename;
    record.file_size = plan_->total_size.value_or(0);
    record.original_workers = plan_->original_workers;
    record.timestamp = unix_now();
    for (const auto& segment : snapshot.segments) {
        record.parts[segment.index] = segment.downloaded;
    }
    return record;
}

void HttpTransfer::checkpoint_(bool force) {
    if (!plan_ || !plan_->resumable() || !progress_) {
        return;
    }
    if (!force && !progress_->claim_checkpoint(options_.checkpoint_interval)) {
        return;
    }

    // Снимок берётся под save_mutex_, чтобы более старый снимок не перезаписал новый
    std::lock_guard lock(save_mutex_);
    const auto record = make_record_(progress_->snapshot());
    if (auto res = store_.save(record); !res) {
        spdlog::warn("Failed to save resume data: {}", res.error().message);
        if (!adapters::fs::is_writable_directory(request_.output_dir)) {
            spdlog::error("No write permissions in {}. Choose a different output directory or check folder permissions.",
                          request_.output_dir.string());
        }
    }
}

void HttpTransfer::emit_progress_() {
    const auto downloaded = progress_->downloaded();
    const double speed = speed_.sample(downloaded, std::chrono::steady_clock::now());
    const auto event = infra::make_progress_event(downloaded, progress_->total_size(), speed);

    std::vector<infra::ProgressObserver> observers;
    {
        std::lock_guard lock(observers_mutex_);
        observers = observers_;
    }
    for (const auto& observer : observers) {
        observer(event);
    }
}

auto HttpTransfer::pause_(TransferResult result) -> TransferResult {
    checkpoint_(true);
    state_ = TransferState::Paused;
    spdlog::info("Download paused");
    if (plan_ && plan_->resumable()) {
        spdlog::info("Resume data saved to: {}", store_.path().string());
    }

    result.paused = true;
    result.error = infra::make_error(infra::ErrorCode::Interrupted, "Transfer paused");
    fill_stats_(result);
    return result;
}

auto HttpTransfer::fail_(TransferResult result, infra::Error error) -> TransferResult {
    state_ = TransferState::Failed;
    result.error = infra::log_and_return(std::move(error));
    fill_stats_(result);
    return result;
}

void HttpTransfer::fill_stats_(TransferResult& result) const {
    result.stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    result.stats.transfer_attempts = attempts_;
    if (progress_) {
        const auto downloaded = progress_->downloaded();
        result.stats.bytes_downloaded = downloaded - std::min(downloaded, initial_bytes_);
        result.stats.bytes_total = progress_->total_size().value_or(downloaded);
    }
}

} // namespace segdl::core
