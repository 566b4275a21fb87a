#include "curl_session.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::net {

namespace {

struct HeaderCapture {
    std::optional<std::string> accept_ranges;
};

struct BodyContext {
    CURL* curl = nullptr;
    const ResponseHandler* handler = nullptr;
    GetResponse response{};
    bool status_checked = false;
};

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
    return text;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
        return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
    });
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* capture = static_cast<HeaderCapture*>(userdata);
    const std::string_view line(buffer, size * nitems);

    // Новая строка статуса (после редиректа): заголовки предыдущего ответа не нужны
    if (line.starts_with("HTTP/")) {
        capture->accept_ranges.reset();
        return size * nitems;
    }

    const auto colon = line.find(':');
    if (colon != std::string_view::npos && iequals(trim(line.substr(0, colon)), "Accept-Ranges")) {
        capture->accept_ranges = std::string(trim(line.substr(colon + 1)));
    }
    return size * nitems;
}

size_t body_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<BodyContext*>(userdata);
    const size_t total = size * nmemb;

    if (!ctx->status_checked) {
        ctx->status_checked = true;
        curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->response.status);
        if (ctx->handler->on_status && !ctx->handler->on_status(ctx->response.status)) {
            ctx->response.rejected = true;
            return 0; // libcurl прервёт передачу с CURLE_WRITE_ERROR
        }
    }

    if (total == 0) {
        return 0;
    }
    if (!ctx->handler->on_body(std::string_view(ptr, total))) {
        ctx->response.stopped = true;
        return 0;
    }
    ctx->response.body_bytes += total;
    return total;
}

auto classify(CURLcode code) -> infra::ErrorCode {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            return infra::ErrorCode::NetworkTimeout;
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return infra::ErrorCode::InvalidArgument;
        default:
            return infra::ErrorCode::SegmentTransient;
    }
}

} // namespace

void ensure_curl_initialized() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

CurlSession::CurlSession(SessionOptions options)
    : options_(std::move(options))
{
    ensure_curl_initialized();
    share_ = curl_share_init();
    if (!share_) {
        throw std::runtime_error("Failed to allocate curl share handle");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlSession::lock_cb);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlSession::unlock_cb);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
}

CurlSession::~CurlSession() {
    if (share_) {
        curl_share_cleanup(share_);
    }
}

void CurlSession::lock_cb(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<CurlSession*>(userptr);
    self->share_locks_[static_cast<std::size_t>(data)].lock();
}

void CurlSession::unlock_cb(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<CurlSession*>(userptr);
    self->share_locks_[static_cast<std::size_t>(data)].unlock();
}

auto CurlSession::factory(SessionOptions options) -> SessionFactory {
    return [options = std::move(options)]() -> SessionPtr {
        return std::make_shared<CurlSession>(options);
    };
}

auto CurlSession::make_handle(const std::string& url) const -> CurlHandle {
    CurlHandle curl{curl_easy_init(), &curl_easy_cleanup};
    if (!curl) {
        return curl;
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(options_.connect_timeout.count()));
    return curl;
}

auto CurlSession::head(const std::string& url) -> infra::Result<HeadResponse> {
    auto curl = make_handle(url);
    if (!curl) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "Failed to allocate curl handle"));
    }

    HeaderCapture capture;
    curl_easy_setopt(curl.get(), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(options_.probe_timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, &header_callback);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &capture);

    const CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(infra::make_error(classify(res),
                             fmt::format("HEAD {} failed: {}", url, curl_easy_strerror(res))));
    }

    HeadResponse response;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);

    // -1, если сервер не прислал Content-Length
    curl_off_t length = -1;
    curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
    if (length >= 0) {
        response.content_length = static_cast<std::uint64_t>(length);
    }

    char* effective = nullptr;
    curl_easy_getinfo(curl.get(), CURLINFO_EFFECTIVE_URL, &effective);
    response.effective_url = effective ? effective : url;
    response.accept_ranges = std::move(capture.accept_ranges);
    return response;
}

auto CurlSession::get(const GetRequest& request, const ResponseHandler& handler)
    -> infra::Result<GetResponse>
{
    auto curl = make_handle(request.url);
    if (!curl) {
        return std::unexpected(infra::make_error(infra::ErrorCode::Unknown, "Failed to allocate curl handle"));
    }

    std::string range;
    if (request.range) {
        range = request.range->last
            ? fmt::format("{}-{}", request.range->first, *request.range->last)
            : fmt::format("{}-", request.range->first);
        curl_easy_setopt(curl.get(), CURLOPT_RANGE, range.c_str());
    }

    // Нет ни одного байта за read_timeout: попытка считается проваленной
    const auto read_seconds = std::max<long>(1, static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(options_.read_timeout).count()));
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, read_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_BUFFERSIZE, static_cast<long>(options_.buffer_size));

    BodyContext ctx{curl.get(), &handler, {}, false};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &body_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &ctx);

    const CURLcode res = curl_easy_perform(curl.get());

    if (!ctx.status_checked) {
        // Пустое тело: статус берём после выполнения
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &ctx.response.status);
        if (res == CURLE_OK && handler.on_status && !handler.on_status(ctx.response.status)) {
            ctx.response.rejected = true;
        }
    }

    if (res == CURLE_WRITE_ERROR && (ctx.response.rejected || ctx.response.stopped)) {
        return ctx.response;
    }
    if (res != CURLE_OK) {
        return std::unexpected(infra::make_error(classify(res),
                             fmt::format("GET {} [{}] failed: {}", request.url,
                                         range.empty() ? "full" : range, curl_easy_strerror(res))));
    }
    return ctx.response;
}

} // namespace segdl::net
