#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "../../infra/error_handler/error.hpp"
#include "../../net/http_session.hpp"

namespace segdl::core {

struct Capabilities {
    std::optional<std::uint64_t> total_size;   // нет Content-Length: размер неизвестен
    bool ranges_supported = false;
};

// HEAD-запрос с переходом по редиректам. Ошибка транспорта или HTTP >= 400 -
// ProbeFailed; отсутствие Range-поддержки ошибкой не считается.
[[nodiscard]] auto probe(net::HttpSession& session, const std::string& url)
    -> infra::Result<Capabilities>;

} // namespace segdl::core
