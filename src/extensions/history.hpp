#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include "../infra/error_handler/error.hpp"

namespace segdl::extensions {

struct HistoryEntry {
    std::string url;
    std::string destination;
    double percent = 0.0;
    std::string status;         // completed / paused / failed
    std::string timestamp;      // локальное время "%Y-%m-%d %H:%M:%S"
};

// Журнал передач в <output_dir>/downloads_history.yaml: два списка,
// completed и incomplete. Один URL живёт не более чем в одном из них.
class TransferHistory {
public:
    explicit TransferHistory(std::filesystem::path file);

    [[nodiscard]] static auto default_path(const std::filesystem::path& output_dir) -> std::filesystem::path;

    // Пустой журнал, если файла нет
    [[nodiscard]] auto load() -> infra::VoidResult;
    [[nodiscard]] auto save() const -> infra::VoidResult;

    // Незавершённая запись с тем же URL заменяется; completed переносит её в другой список
    void record(HistoryEntry entry, bool completed);
    void forget(const std::string& url);

    [[nodiscard]] auto completed() const -> const std::vector<HistoryEntry>& { return completed_; }
    [[nodiscard]] auto incomplete() const -> const std::vector<HistoryEntry>& { return incomplete_; }
    [[nodiscard]] auto find(const std::string& url) const -> std::optional<HistoryEntry>;

    // Печатает журнал в stdout
    void print() const;

private:
    std::filesystem::path file_;
    std::vector<HistoryEntry> completed_;
    std::vector<HistoryEntry> incomplete_;
};

[[nodiscard]] auto current_timestamp() -> std::string;

} // namespace segdl::extensions
