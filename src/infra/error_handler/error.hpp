#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace segdl::infra {

enum class ErrorCode {
    // Фатальные для текущего запуска
    ProbeFailed,        // сервер недоступен / размер не определить
    RetryExhausted,     // исчерпан общий бюджет повторов
    Corruption,         // размер сегмента не совпал при слиянии
    InvalidPath,
    PermissionDenied,
    InvalidArgument,

    // Восстанавливаемые (retry на уровне сегмента)
    SegmentTransient,   // сеть оборвалась, тело короче диапазона
    HttpStatus,         // неожиданный код ответа
    RangeViolation,     // просили Range, а пришёл 200
    NetworkTimeout,
    Persistence,        // не удалось записать resume-файл

    // Прочие
    ChecksumMismatch,
    Interrupted,
    Unknown,
};

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    Error(ErrorCode c, std::string_view msg,
          const std::source_location& loc = std::source_location::current())
        : code(c)
        , message(msg)
        , file(loc.file_name())
        , line(static_cast<int>(loc.line()))
        , function(loc.function_name())
    {}

    [[nodiscard]] auto is_fatal() const -> bool;
    [[nodiscard]] auto to_exit_code() const -> int;
    [[nodiscard]] auto what() const -> const char*;

    [[nodiscard]] auto is_transient() const -> bool {
        return code == ErrorCode::SegmentTransient ||
               code == ErrorCode::HttpStatus ||
               code == ErrorCode::RangeViolation ||
               code == ErrorCode::NetworkTimeout ||
               code == ErrorCode::Persistence;
    }
};

template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// Логирует ошибку (error для фатальных, warn для прочих) и возвращает её
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace segdl::infra
