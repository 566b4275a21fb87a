#include "transfer_types.hpp"

#include <cctype>
#include <fmt/core.h>

namespace segdl::core {

auto derive_filename(std::string_view url) -> std::string {
    // Отрезаем схему+хост, query и fragment
    if (const auto scheme = url.find("://"); scheme != std::string_view::npos) {
        url.remove_prefix(scheme + 3);
        const auto slash = url.find('/');
        url = slash == std::string_view::npos ? std::string_view{} : url.substr(slash);
    }
    if (const auto cut = url.find_first_of("?#"); cut != std::string_view::npos) {
        url = url.substr(0, cut);
    }
    if (const auto slash = url.rfind('/'); slash != std::string_view::npos) {
        url.remove_prefix(slash + 1);
    }

    std::string clean;
    for (const char c : url) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-' || c == '_') {
            clean += c;
        }
        if (clean.size() == 255) break;
    }

    // "." и ".." не годятся как имя файла
    if (clean.empty() || clean == "." || clean == "..") {
        return "download";
    }
    return clean;
}

auto TransferRequest::make(std::string url,
                           std::filesystem::path output_dir,
                           std::uint32_t workers,
                           std::optional<std::string> explicit_filename) -> TransferRequest
{
    // Явное имя без последнего компонента ("dir/", "..") не задаёт файл
    std::string name;
    if (explicit_filename) {
        name = std::filesystem::path(*explicit_filename).filename().string();
    }
    TransferRequest request;
    request.filename = name.empty() || name == "." || name == ".."
        ? derive_filename(url)
        : std::move(name);
    request.url = std::move(url);
    request.output_dir = std::move(output_dir);
    request.workers = workers == 0 ? 1 : workers;
    return request;
}

auto part_file(const std::filesystem::path& parts_dir, std::uint32_t index) -> std::filesystem::path {
    return parts_dir / fmt::format("part_{}", index);
}

auto to_string(TransferState state) -> std::string_view {
    switch (state) {
        case TransferState::Idle:      return "idle";
        case TransferState::Planning:  return "planning";
        case TransferState::Running:   return "running";
        case TransferState::Paused:    return "paused";
        case TransferState::Retrying:  return "retrying";
        case TransferState::Merging:   return "merging";
        case TransferState::Completed: return "completed";
        case TransferState::Failed:    return "failed";
    }
    return "unknown";
}

} // namespace segdl::core
