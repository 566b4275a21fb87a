#include "capability_prober.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace segdl::core {

namespace {

auto is_none(std::string value) -> bool {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "none";
}

} // namespace

auto probe(net::HttpSession& session, const std::string& url) -> infra::Result<Capabilities> {
    auto head = session.head(url);
    if (!head) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProbeFailed,
                             fmt::format("Connection failed: {}", head.error().message)));
    }

    if (head->status >= 400 || head->status == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::ProbeFailed,
                             fmt::format("Server answered HTTP {} for {}", head->status, url)));
    }

    if (!head->effective_url.empty() && head->effective_url != url) {
        spdlog::info("Redirected to {}", head->effective_url);
    }

    Capabilities caps;
    caps.total_size = head->content_length;
    caps.ranges_supported = head->accept_ranges.has_value() && !is_none(*head->accept_ranges);

    if (!caps.total_size) {
        spdlog::warn("Server did not provide Content-Length. Progress unknown.");
    }
    if (!caps.ranges_supported) {
        spdlog::warn("Server doesn't support resumable downloads. Using single-stream mode.");
    }
    spdlog::debug("Probe {}: size={}, ranges={}", url,
                  caps.total_size ? fmt::to_string(*caps.total_size) : "unknown",
                  caps.ranges_supported);
    return caps;
}

} // namespace segdl::core
