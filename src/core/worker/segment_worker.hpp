#pragma once

#include <cstdint>
#include <functional>
#include "../model/transfer_types.hpp"
#include "../progress/shared_progress.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../infra/retry.hpp"
#include "../../net/http_session.hpp"

namespace segdl::core {

enum class SegmentOutcome {
    Completed,
    Cancelled,  // увидели флаг отмены, файл оставлен для resume
    Failed,     // попытки исчерпаны, ошибка учтена в SharedProgress
};

using CheckpointFn = std::function<void()>;

// Качает один сегмент (или весь ресурс в однопоточном режиме), дописывая
// в part_<index>. Ошибки сегмента наружу не пробрасываются: после
// исчерпания попыток увеличивается счётчик ошибок и возвращается Failed.
class SegmentWorker {
public:
    SegmentWorker(std::uint32_t index,
                  const TransferRequest& request,
                  const TransferPlan& plan,
                  net::SessionPtr session,
                  SharedProgress& progress,
                  infra::CancellationToken cancel,
                  infra::RetryPolicy retry,
                  CheckpointFn checkpoint = {});

    [[nodiscard]] auto run() -> SegmentOutcome;

private:
    // Одна попытка: запрос [start+downloaded, end] и запись тела
    [[nodiscard]] auto attempt_() -> infra::VoidResult;

    [[nodiscard]] auto sync_part_file_(const std::filesystem::path& path,
                                       std::uint64_t downloaded) const -> infra::VoidResult;

    std::uint32_t index_;
    const TransferRequest& request_;
    const TransferPlan& plan_;
    net::SessionPtr session_;
    SharedProgress& progress_;
    infra::CancellationToken cancel_;
    infra::RetryPolicy retry_;
    CheckpointFn checkpoint_;
};

} // namespace segdl::core
