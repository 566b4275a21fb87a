#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "../transfer.hpp"
#include "../progress/shared_progress.hpp"
#include "../../extensions/resumer.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../net/http_session.hpp"

namespace segdl::core {

// Supervisor сегментированной HTTP-передачи:
//   Planning -> Running -> {Paused, Retrying, Merging} -> {Completed, Failed}
// Владеет жизненным циклом воркеров, агрегирует прогресс, пишет чекпоинты
// и крутит цикл повторов всей передачи. Отмена только кооперативная,
// через токен, переданный при создании.
class HttpTransfer final : public Transfer {
public:
    HttpTransfer(TransferRequest request,
                 EngineOptions options,
                 net::SessionFactory sessions,
                 infra::CancellationToken cancel = {});
    ~HttpTransfer() override;

    HttpTransfer(const HttpTransfer&) = delete;
    HttpTransfer& operator=(const HttpTransfer&) = delete;

    [[nodiscard]] auto start() -> TransferResult override;
    void pause() override;
    [[nodiscard]] auto resume() -> TransferResult override;
    void subscribe(infra::ProgressObserver observer) override;

    [[nodiscard]] auto state() const -> TransferState override { return state_.load(); }
    [[nodiscard]] auto destination() const -> std::filesystem::path override { return request_.destination(); }

    [[nodiscard]] auto request() const -> const TransferRequest& { return request_; }
    [[nodiscard]] auto plan() const -> std::optional<TransferPlan>;

    // Текущие сегменты (после planning), для отчётов и тестов
    [[nodiscard]] auto segments() const -> std::vector<Segment>;

private:
    [[nodiscard]] auto run_() -> TransferResult;
    [[nodiscard]] auto prepare_(net::HttpSession& session) -> infra::Result<std::vector<Segment>>;
    [[nodiscard]] auto rehydrate_(const ResumeRecord& record, std::uint64_t total_size) -> std::vector<Segment>;
    void run_workers_(const std::vector<std::uint32_t>& pending, const net::SessionPtr& session);

    [[nodiscard]] auto make_record_(const SharedProgress::Snapshot& snapshot) const -> ResumeRecord;
    void checkpoint_(bool force);
    void emit_progress_();

    [[nodiscard]] auto pause_(TransferResult result) -> TransferResult;
    [[nodiscard]] auto fail_(TransferResult result, infra::Error error) -> TransferResult;
    void fill_stats_(TransferResult& result) const;

    TransferRequest request_;
    EngineOptions options_;
    net::SessionFactory sessions_;
    infra::CancellationToken cancel_;
    extensions::ResumeStore store_;

    std::atomic<TransferState> state_{TransferState::Idle};
    std::atomic<bool> active_{false};

    mutable std::mutex plan_mutex_;
    std::optional<TransferPlan> plan_;
    std::shared_ptr<SharedProgress> progress_;

    std::mutex save_mutex_;
    std::mutex observers_mutex_;
    std::vector<infra::ProgressObserver> observers_;
    infra::SpeedMeter speed_;

    std::chrono::steady_clock::time_point started_{};
    std::uint64_t initial_bytes_ = 0;
    int attempts_ = 0;
};

} // namespace segdl::core
