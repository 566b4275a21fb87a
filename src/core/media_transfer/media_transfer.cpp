#include "media_transfer.hpp"

#include <cctype>
#include <spdlog/spdlog.h>

namespace segdl::core {

auto filename_from_title(const std::string& title, const std::string& fallback_url) -> std::string {
    std::string name;
    name.reserve(title.size());
    for (const char ch : title) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || ch == '.' || ch == '-' || ch == '_') {
            name.push_back(ch);
        } else if (!name.empty() && name.back() != '_') {
            name.push_back('_');
        }
    }
    while (!name.empty() && (name.back() == '_' || name.back() == '.')) {
        name.pop_back();
    }
    if (name.empty()) {
        return derive_filename(fallback_url);
    }
    if (name.size() > 250) {
        name.resize(250);
    }
    return name;
}

MediaTransfer::MediaTransfer(std::string page_url,
                             std::filesystem::path output_dir,
                             std::uint32_t workers,
                             ResolverPtr resolver,
                             EngineOptions options,
                             net::SessionFactory sessions,
                             infra::CancellationToken cancel,
                             std::optional<std::string> filename)
    : page_url_(std::move(page_url))
    , output_dir_(std::move(output_dir))
    , workers_(workers)
    , resolver_(std::move(resolver))
    , options_(std::move(options))
    , sessions_(std::move(sessions))
    , cancel_(std::move(cancel))
    , filename_(std::move(filename))
{}

auto MediaTransfer::ensure_inner_() -> infra::Result<HttpTransfer*> {
    std::lock_guard lock(mutex_);
    if (inner_) {
        return inner_.get();
    }

    spdlog::info("Resolving media stream: {}", page_url_);
    auto stream = resolver_->resolve(page_url_);
    if (!stream) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProbeFailed,
            "Cannot resolve media stream: " + stream.error().message));
    }

    auto name = filename_ ? *filename_
                          : filename_from_title(stream->title.value_or(""), page_url_);
    auto request = TransferRequest::make(stream->url, output_dir_, workers_, std::move(name));
    request.size_hint = stream->size;

    inner_ = std::make_unique<HttpTransfer>(std::move(request), options_, sessions_, cancel_);
    for (auto& observer : observers_) {
        inner_->subscribe(std::move(observer));
    }
    observers_.clear();
    return inner_.get();
}

auto MediaTransfer::start() -> TransferResult {
    auto inner = ensure_inner_();
    if (!inner) {
        TransferResult result;
        result.destination = output_dir_;
        {
            std::lock_guard lock(mutex_);
            failed_state_ = TransferState::Failed;
        }
        result.error = infra::log_and_return(std::move(inner.error()));
        return result;
    }
    return (*inner)->start();
}

void MediaTransfer::pause() {
    cancel_.request();
}

auto MediaTransfer::resume() -> TransferResult {
    cancel_.reset();
    return start();
}

void MediaTransfer::subscribe(infra::ProgressObserver observer) {
    std::lock_guard lock(mutex_);
    if (inner_) {
        inner_->subscribe(std::move(observer));
    } else {
        observers_.push_back(std::move(observer));
    }
}

auto MediaTransfer::state() const -> TransferState {
    std::lock_guard lock(mutex_);
    return inner_ ? inner_->state() : failed_state_;
}

auto MediaTransfer::destination() const -> std::filesystem::path {
    std::lock_guard lock(mutex_);
    return inner_ ? inner_->destination() : output_dir_;
}

} // namespace segdl::core
