#pragma once

#include <string>
#include <string_view>
#include <system_error>
#include <source_location>
#include <expected>
#include <spdlog/spdlog.h>

namespace pagesync::infra {

enum class ErrorCode {
    // Фатальные ошибки (сессия прерывается)
    SourceRead,
    PrecheckMismatch,
    ObjectExists,
    InvalidArgument,
    Storage,
    Config,

    // Восстанавливаемые (retry по политике запроса)
    Transfer,
    Throttled,

    // Итог сессии
    PartialSession,
    Interrupted,

    Unknown,
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string file;
    int line;
    std::string function;

    // Конструктор с автоматическим захватом location
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
        return code == ErrorCode::Transfer ||
               code == ErrorCode::Throttled;
    }
};

// Псевдонимы для удобства
template<typename T>
using Result = std::expected<T, Error>;

using VoidResult = Result<void>;

[[nodiscard]] auto make_error(
    ErrorCode code,
    std::string_view message,
    const std::source_location& loc = std::source_location::current()
) -> Error;

// errno -> Error с текстом системной ошибки
[[nodiscard]] auto make_errno_error(
    ErrorCode code,
    std::string_view context,
    int err,
    const std::source_location& loc = std::source_location::current()
) -> Error;

[[nodiscard]] auto to_string(ErrorCode code) -> std::string_view;

// Логирование ошибки и возврат
[[nodiscard]] auto log_and_return(Error&& err) -> Error;

} // namespace pagesync::infra
