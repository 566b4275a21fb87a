#pragma once

#include "http_session.hpp"

#include <array>
#include <memory>
#include <mutex>

#include <curl/curl.h>

namespace segdl::net {

// Инициализация libcurl один раз на процесс
void ensure_curl_initialized();

// HttpSession поверх libcurl easy-хендлов. Каждый запрос получает свой
// easy-хендл, а кэш соединений и DNS разделяются через CURLSH.
// Новая сессия: новый пул соединений.
class CurlSession final : public HttpSession {
public:
    explicit CurlSession(SessionOptions options);
    ~CurlSession() override;

    CurlSession(const CurlSession&) = delete;
    CurlSession& operator=(const CurlSession&) = delete;

    [[nodiscard]] auto head(const std::string& url) -> infra::Result<HeadResponse> override;
    [[nodiscard]] auto get(const GetRequest& request, const ResponseHandler& handler)
        -> infra::Result<GetResponse> override;

    [[nodiscard]] static auto factory(SessionOptions options) -> SessionFactory;

private:
    using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

    [[nodiscard]] auto make_handle(const std::string& url) const -> CurlHandle;

    static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

    SessionOptions options_;
    CURLSH* share_ = nullptr;
    std::array<std::mutex, static_cast<std::size_t>(CURL_LOCK_DATA_LAST)> share_locks_;
};

} // namespace segdl::net
