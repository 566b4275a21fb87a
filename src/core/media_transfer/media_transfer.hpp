#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "../transfer.hpp"
#include "../http_transfer/http_transfer.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/interrupt.hpp"
#include "../../net/http_session.hpp"

namespace segdl::core {

// Прямая ссылка на поток, полученная от внешнего резолвера
struct ResolvedStream {
    std::string url;
    std::optional<std::uint64_t> size;
    std::optional<std::string> title;
};

// Превращает страницу медиа-сервиса в прямую ссылку
class StreamResolver {
public:
    virtual ~StreamResolver() = default;
    [[nodiscard]] virtual auto resolve(const std::string& page_url) -> infra::Result<ResolvedStream> = 0;
};

using ResolverPtr = std::shared_ptr<StreamResolver>;

// Передача медиа-потока: резолвит ссылку, дальше работает обычный HttpTransfer.
// Размер от резолвера используется, если сервер не прислал Content-Length.
class MediaTransfer final : public Transfer {
public:
    MediaTransfer(std::string page_url,
                  std::filesystem::path output_dir,
                  std::uint32_t workers,
                  ResolverPtr resolver,
                  EngineOptions options,
                  net::SessionFactory sessions,
                  infra::CancellationToken cancel = {},
                  std::optional<std::string> filename = std::nullopt);

    [[nodiscard]] auto start() -> TransferResult override;
    void pause() override;
    [[nodiscard]] auto resume() -> TransferResult override;
    void subscribe(infra::ProgressObserver observer) override;

    [[nodiscard]] auto state() const -> TransferState override;
    [[nodiscard]] auto destination() const -> std::filesystem::path override;

private:
    [[nodiscard]] auto ensure_inner_() -> infra::Result<HttpTransfer*>;

    std::string page_url_;
    std::filesystem::path output_dir_;
    std::uint32_t workers_;
    ResolverPtr resolver_;
    EngineOptions options_;
    net::SessionFactory sessions_;
    infra::CancellationToken cancel_;
    std::optional<std::string> filename_;

    mutable std::mutex mutex_;
    std::unique_ptr<HttpTransfer> inner_;
    std::vector<infra::ProgressObserver> observers_;
    TransferState failed_state_ = TransferState::Idle;
};

// Имя файла из заголовка ролика: небезопасные символы заменяются на '_'
[[nodiscard]] auto filename_from_title(const std::string& title, const std::string& fallback_url) -> std::string;

} // namespace segdl::core
