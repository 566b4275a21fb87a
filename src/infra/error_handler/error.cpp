#include "error.hpp"
#include <cstdlib>
#include <fmt/core.h>

namespace segdl::infra {

auto to_string(ErrorCode code) -> std::string_view {
    switch (code) {
        case ErrorCode::ProbeFailed:      return "ProbeFailed";
        case ErrorCode::RetryExhausted:   return "RetryExhausted";
        case ErrorCode::Corruption:       return "Corruption";
        case ErrorCode::InvalidPath:      return "InvalidPath";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::SegmentTransient: return "SegmentTransient";
        case ErrorCode::HttpStatus:       return "HttpStatus";
        case ErrorCode::RangeViolation:   return "RangeViolation";
        case ErrorCode::NetworkTimeout:   return "NetworkTimeout";
        case ErrorCode::Persistence:      return "Persistence";
        case ErrorCode::ChecksumMismatch: return "ChecksumMismatch";
        case ErrorCode::Interrupted:      return "Interrupted";
        case ErrorCode::Unknown:          break;
    }
    return "Unknown";
}

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::ProbeFailed:
        case ErrorCode::RetryExhausted:
        case ErrorCode::Corruption:
        case ErrorCode::InvalidPath:
        case ErrorCode::PermissionDenied:
        case ErrorCode::InvalidArgument:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::Corruption:       return 22;
        case ErrorCode::ChecksumMismatch: return 23;
        case ErrorCode::RetryExhausted:   return 24;
        case ErrorCode::ProbeFailed:      return 25;
        case ErrorCode::Interrupted:      return 130; // SIGINT
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, message, loc};
}

Error log_and_return(Error&& err) {
    auto level = err.is_fatal() ? spdlog::level::err : spdlog::level::warn;
    spdlog::log(level,
        "[{}:{} in {}] {}: {}",
        err.file, err.line, err.function,
        to_string(err.code), err.message
    );
    return std::move(err);
}

} // namespace segdl::infra
