#include "history.hpp"
#include "../adapters/fs.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace segdl::extensions {

namespace {

auto erase_url(std::vector<HistoryEntry>& entries, const std::string& url) -> void {
    std::erase_if(entries, [&](const HistoryEntry& e) { return e.url == url; });
}

auto read_list(const YAML::Node& node) -> std::vector<HistoryEntry> {
    std::vector<HistoryEntry> entries;
    if (!node || !node.IsSequence()) {
        return entries;
    }
    for (const auto& item : node) {
        if (!item.IsMap() || !item["url"]) {
            continue;
        }
        HistoryEntry entry;
        entry.url = item["url"].as<std::string>();
        entry.destination = item["destination"].as<std::string>("");
        entry.percent = item["percent"].as<double>(0.0);
        entry.status = item["status"].as<std::string>("");
        entry.timestamp = item["timestamp"].as<std::string>("");
        entries.push_back(std::move(entry));
    }
    return entries;
}

auto write_list(YAML::Emitter& out, const char* key, const std::vector<HistoryEntry>& entries) -> void {
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto& e : entries) {
        out << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << e.url;
        out << YAML::Key << "destination" << YAML::Value << e.destination;
        out << YAML::Key << "percent" << YAML::Value << e.percent;
        out << YAML::Key << "status" << YAML::Value << e.status;
        out << YAML::Key << "timestamp" << YAML::Value << e.timestamp;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
}

} // namespace

auto current_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

TransferHistory::TransferHistory(std::filesystem::path file)
    : file_(std::move(file))
{}

auto TransferHistory::default_path(const std::filesystem::path& output_dir) -> std::filesystem::path {
    return output_dir / "downloads_history.yaml";
}

auto TransferHistory::load() -> infra::VoidResult {
    completed_.clear();
    incomplete_.clear();
    if (!std::filesystem::exists(file_)) {
        return {};
    }
    try {
        YAML::Node root = YAML::LoadFile(file_.string());
        completed_ = read_list(root["completed"]);
        incomplete_ = read_list(root["incomplete"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence,
            fmt::format("Invalid history file {}: {}", file_.string(), e.what())));
    }
    return {};
}

auto TransferHistory::save() const -> infra::VoidResult {
    YAML::Emitter out;
    out << YAML::BeginMap;
    write_list(out, "completed", completed_);
    write_list(out, "incomplete", incomplete_);
    out << YAML::EndMap;

    if (auto res = adapters::fs::ensure_directory(file_.parent_path()); !res) {
        return res;
    }
    return adapters::fs::atomic_write(file_, out.c_str());
}

void TransferHistory::record(HistoryEntry entry, bool completed) {
    erase_url(incomplete_, entry.url);
    if (completed) {
        erase_url(completed_, entry.url);
        completed_.push_back(std::move(entry));
    } else {
        incomplete_.push_back(std::move(entry));
    }
}

void TransferHistory::forget(const std::string& url) {
    erase_url(incomplete_, url);
    erase_url(completed_, url);
}

auto TransferHistory::find(const std::string& url) const -> std::optional<HistoryEntry> {
    for (const auto* list : {&incomplete_, &completed_}) {
        const auto it = std::find_if(list->begin(), list->end(),
                                     [&](const HistoryEntry& e) { return e.url == url; });
        if (it != list->end()) {
            return *it;
        }
    }
    return std::nullopt;
}

void TransferHistory::print() const {
    fmt::print("Completed ({}):\n", completed_.size());
    for (const auto& e : completed_) {
        fmt::print("  [{}] {} -> {}\n", e.timestamp, e.url, e.destination);
    }
    fmt::print("Incomplete ({}):\n", incomplete_.size());
    for (const auto& e : incomplete_) {
        fmt::print("  [{}] {} -> {} ({:.1f}%, {})\n", e.timestamp, e.url, e.destination, e.percent, e.status);
    }
}

} // namespace segdl::extensions
