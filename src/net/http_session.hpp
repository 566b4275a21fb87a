#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace segdl::net {

struct HeadResponse {
    long status = 0;
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> accept_ranges;   // значение заголовка Accept-Ranges, если был
    std::string effective_url;                  // после редиректов
};

// Диапазон [first, last]; без last: до конца ресурса
struct ByteRange {
    std::uint64_t first = 0;
    std::optional<std::uint64_t> last;
};

struct GetRequest {
    std::string url;
    std::optional<ByteRange> range;
};

struct GetResponse {
    long status = 0;
    std::uint64_t body_bytes = 0;   // сколько байт тела принял обработчик
    bool rejected = false;          // on_status отверг ответ, тело не читалось
    bool stopped = false;           // on_body попросил остановиться
};

// Обработчик ответа: сначала статус (false: отвергнуть ответ до чтения тела),
// затем куски тела (false: прекратить чтение).
struct ResponseHandler {
    std::function<bool(long status)> on_status;
    std::function<bool(std::string_view chunk)> on_body;
};

struct SessionOptions {
    std::chrono::milliseconds probe_timeout{10'000};
    std::chrono::milliseconds connect_timeout{10'000};
    std::chrono::milliseconds read_timeout{30'000};   // окно, за которое должен прийти хоть один байт
    std::size_t buffer_size = 64 * 1024;              // размер куска тела за один вызов on_body
    std::string user_agent = "segdl/1.0";
};

// Транспортная сессия. Один экземпляр используется всеми воркерами прогона,
// поэтому реализации обязаны быть потокобезопасными.
class HttpSession {
public:
    virtual ~HttpSession() = default;

    // Запрос только метаданных, с переходом по редиректам
    [[nodiscard]] virtual auto head(const std::string& url) -> infra::Result<HeadResponse> = 0;

    // Потоковый GET. Ошибка транспорта (обрыв, таймаут) возвращается как Error,
    // любые HTTP-ответы: как GetResponse.
    [[nodiscard]] virtual auto get(const GetRequest& request, const ResponseHandler& handler)
        -> infra::Result<GetResponse> = 0;
};

using SessionPtr = std::shared_ptr<HttpSession>;
using SessionFactory = std::function<SessionPtr()>;

} // namespace segdl::net
