#include "error.hpp"
#include <fmt/core.h>
#include <cstdlib>

namespace pagesync::infra {

bool Error::is_fatal() const {
    switch (code) {
        case ErrorCode::SourceRead:
        case ErrorCode::PrecheckMismatch:
        case ErrorCode::ObjectExists:
        case ErrorCode::InvalidArgument:
        case ErrorCode::Storage:
        case ErrorCode::Config:
            return true;
        default:
            return false;
    }
}

int Error::to_exit_code() const {
    switch (code) {
        case ErrorCode::PartialSession:   return 20;
        case ErrorCode::PrecheckMismatch: return 21;
        case ErrorCode::ObjectExists:     return 22;
        case ErrorCode::SourceRead:       return 23;
        case ErrorCode::Interrupted:      return 130; // SIGINT
        default:                          return EXIT_FAILURE;
    }
}

const char* Error::what() const {
    return message.c_str();
}

Error make_error(ErrorCode code, std::string_view message,
                 const std::source_location& loc) {
    return Error{code, std::string(message), loc};
}

Error make_errno_error(ErrorCode code, std::string_view context, int err,
                       const std::source_location& loc) {
    return Error{code,
                 fmt::format("{}: {}", context, std::generic_category().message(err)),
                 loc};
}

std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceRead:       return "SourceRead";
        case ErrorCode::PrecheckMismatch: return "PrecheckMismatch";
        case ErrorCode::ObjectExists:     return "ObjectExists";
        case ErrorCode::InvalidArgument:  return "InvalidArgument";
        case ErrorCode::Storage:          return "Storage";
        case ErrorCode::Config:           return "Config";
        case ErrorCode::Transfer:         return "Transfer";
        case ErrorCode::Throttled:        return "Throttled";
        case ErrorCode::PartialSession:   return "PartialSession";
        case ErrorCode::Interrupted:      return "Interrupted";
        case ErrorCode::Unknown:          return "Unknown";
    }
    return "Unknown";
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

} // namespace pagesync::infra
