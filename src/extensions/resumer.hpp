#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "../core/model/transfer_types.hpp"
#include "../infra/error_handler/error.hpp"
#include "../infra/retry.hpp"

namespace segdl::extensions {

// Resume-файл одной передачи и её каталог сегментов.
// Наличие файла с совпадающими (url, filename): единственный признак resume.
class ResumeStore {
public:
    ResumeStore(std::filesystem::path resume_file, std::filesystem::path parts_dir);
    explicit ResumeStore(const core::TransferRequest& request);

    // Запись, пригодная для этого запроса, или nullopt. Битая или чужая
    // запись считается отсутствующей, а хранилище очищается.
    [[nodiscard]] auto load(const core::TransferRequest& request) -> std::optional<core::ResumeRecord>;

    // Атомарная запись (tmp + fsync + rename) с несколькими попытками.
    // Ошибка: Persistence, для передачи не фатальна.
    [[nodiscard]] auto save(const core::ResumeRecord& record) -> infra::VoidResult;

    // Удаляет resume-файл и файлы сегментов. Повторный вызов: no-op.
    void clear();

    [[nodiscard]] auto exists() const -> bool;
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return resume_file_; }
    [[nodiscard]] auto parts_dir() const -> const std::filesystem::path& { return parts_dir_; }

private:
    std::filesystem::path resume_file_;
    std::filesystem::path parts_dir_;
    infra::RetryPolicy retry_{.max_attempts = 3,
                              .initial_delay = std::chrono::milliseconds(500),
                              .backoff_factor = 1.0};
};

[[nodiscard]] auto serialize_resume_record(const core::ResumeRecord& record) -> std::string;

// Разбор без проверки принадлежности запросу
[[nodiscard]] auto parse_resume_record(const std::string& text) -> infra::Result<core::ResumeRecord>;
[[nodiscard]] auto read_resume_record(const std::filesystem::path& resume_file) -> infra::Result<core::ResumeRecord>;

// Все читаемые *.resume в каталоге (для --list)
[[nodiscard]] auto list_resumable(const std::filesystem::path& dir)
    -> std::vector<std::pair<std::filesystem::path, core::ResumeRecord>>;

} // namespace segdl::extensions
