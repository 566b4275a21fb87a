#include "resumer.hpp"
#include "../adapters/fs.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace segdl::extensions {

namespace {

auto validation_error(std::string_view message) -> infra::Error {
    return infra::make_error(infra::ErrorCode::Persistence, message);
}

} // namespace

ResumeStore::ResumeStore(std::filesystem::path resume_file, std::filesystem::path parts_dir)
    : resume_file_(std::move(resume_file))
    , parts_dir_(std::move(parts_dir))
{}

ResumeStore::ResumeStore(const core::TransferRequest& request)
    : ResumeStore(request.resume_file(), request.parts_dir())
{}

auto serialize_resume_record(const core::ResumeRecord& record) -> std::string {
    // Flow-стиль с кавычками: результат одновременно валидный JSON
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetDoublePrecision(17);

    out << YAML::BeginMap;
    out << YAML::Key << "url" << YAML::Value << record.url;
    out << YAML::Key << "filename" << YAML::Value << record.filename;
    out << YAML::Key << "file_size" << YAML::Value << record.file_size;
    out << YAML::Key << "parts" << YAML::Value << YAML::BeginMap;
    for (const auto& [index, bytes] : record.parts) {
        out << YAML::Key << std::to_string(index) << YAML::Value << bytes;
    }
    out << YAML::EndMap;
    out << YAML::Key << "timestamp" << YAML::Value << record.timestamp;
    out << YAML::Key << "original_worker_count" << YAML::Value << record.original_workers;
    out << YAML::EndMap;
    return out.c_str();
}

auto parse_resume_record(const std::string& text) -> infra::Result<core::ResumeRecord> {
    try {
        YAML::Node node = YAML::Load(text);
        if (!node.IsMap()) {
            return std::unexpected(validation_error("Resume record is not a map"));
        }
        for (const char* key : {"url", "filename", "file_size", "parts"}) {
            if (!node[key]) {
                return std::unexpected(validation_error(fmt::format("Missing required key '{}'", key)));
            }
        }

        core::ResumeRecord record;
        record.url = node["url"].as<std::string>();
        record.filename = node["filename"].as<std::string>();
        record.file_size = node["file_size"].as<std::uint64_t>();
        if (node["timestamp"]) record.timestamp = node["timestamp"].as<double>();
        if (node["original_worker_count"]) {
            record.original_workers = node["original_worker_count"].as<std::uint32_t>();
        } else {
            // Старая запись без счётчика: по числу частей
            record.original_workers = static_cast<std::uint32_t>(std::max<std::size_t>(node["parts"].size(), 1));
        }

        if (!node["parts"].IsMap()) {
            return std::unexpected(validation_error("'parts' must be a map"));
        }
        for (const auto& part : node["parts"]) {
            record.parts[part.first.as<std::uint32_t>()] = part.second.as<std::uint64_t>();
        }
        return record;

    } catch (const YAML::Exception& e) {
        return std::unexpected(validation_error(fmt::format("Cannot parse resume record: {}", e.what())));
    }
}

auto read_resume_record(const std::filesystem::path& resume_file) -> infra::Result<core::ResumeRecord> {
    std::ifstream in(resume_file, std::ios::binary);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                             fmt::format("Cannot open {}", resume_file.string())));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_resume_record(buffer.str());
}

auto ResumeStore::load(const core::TransferRequest& request) -> std::optional<core::ResumeRecord> {
    if (!std::filesystem::exists(resume_file_)) {
        return std::nullopt;
    }

    auto record = read_resume_record(resume_file_);
    if (!record) {
        spdlog::warn("Invalid resume file {}: {}", resume_file_.string(), record.error().message);
        clear();
        return std::nullopt;
    }

    std::string reason;
    if (record->url != request.url) {
        reason = "URL mismatch";
    } else if (record->filename != request.filename) {
        reason = "Filename mismatch";
    } else if (record->original_workers == 0) {
        reason = "zero worker count";
    } else if (std::any_of(record->parts.begin(), record->parts.end(),
                           [&](const auto& part) { return part.first >= record->original_workers; })) {
        reason = "part index out of range";
    }

    if (!reason.empty()) {
        spdlog::warn("Invalid resume file {}: {}", resume_file_.string(), reason);
        clear();
        return std::nullopt;
    }
    return *record;
}

auto ResumeStore::save(const core::ResumeRecord& record) -> infra::VoidResult {
    if (auto res = adapters::fs::ensure_directory(resume_file_.parent_path()); !res) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Persistence, res.error().message));
    }

    const auto content = serialize_resume_record(record);
    return infra::with_retry([&](int) {
        return adapters::fs::atomic_write(resume_file_, content);
    }, retry_);
}

void ResumeStore::clear() {
    std::error_code ec;
    if (std::filesystem::exists(resume_file_, ec)) {
        adapters::fs::remove_quietly(resume_file_);
    }

    if (std::filesystem::is_directory(parts_dir_, ec)) {
        for (const auto& entry : std::filesystem::directory_iterator(parts_dir_, ec)) {
            if (entry.path().filename().string().starts_with("part_")) {
                adapters::fs::remove_quietly(entry.path());
            }
        }
        std::filesystem::remove(parts_dir_, ec);
        if (ec) {
            spdlog::warn("Could not remove parts directory: {}", parts_dir_.string());
        }
    }
}

auto ResumeStore::exists() const -> bool {
    std::error_code ec;
    return std::filesystem::exists(resume_file_, ec);
}

auto list_resumable(const std::filesystem::path& dir)
    -> std::vector<std::pair<std::filesystem::path, core::ResumeRecord>>
{
    std::vector<std::pair<std::filesystem::path, core::ResumeRecord>> result;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return result;
    }

    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".resume") {
            continue;
        }
        auto record = read_resume_record(entry.path());
        if (!record) {
            spdlog::debug("Skipping {}: {}", entry.path().string(), record.error().message);
            continue;
        }
        result.emplace_back(entry.path(), std::move(*record));
    }

    std::sort(result.begin(), result.end(),
              [](const auto& a, const auto& b) { return a.first < b.first; });
    return result;
}

} // namespace segdl::extensions
