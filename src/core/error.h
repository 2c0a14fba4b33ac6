#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace core {

// ErrorCode: what went wrong, grouped by subsystem.  Values are stable and
// appear in formatted messages.
enum class ErrorCode : uint16_t {
    NONE                 = 0,
    // Decoding of records and option values (100-199)
    PARSE_ERROR          = 100,
    PARSE_BAD_FORMAT     = 103,
    // Caller-supplied values (200-299)
    VALIDATION_ERROR     = 200,
    VALIDATION_RANGE     = 201,
    // Persistence (500-599)
    STORAGE_ERROR        = 500,
    STORAGE_NOT_FOUND    = 501,
    STORAGE_CORRUPT      = 502,
    STORAGE_OPEN         = 503,
    STORAGE_READ         = 504,
    STORAGE_WRITE        = 505,
    STORAGE_LOCKED       = 506,
    // Fee estimation (800-899)
    ESTIMATE_UNAVAILABLE = 801,
    // Bugs (900-999)
    INTERNAL_ERROR       = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: code, message and the source location that raised it.
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }

    /// Same code and origin, message prefixed with "@p what: ".
    [[nodiscard]] Error with_context(std::string_view what) const;

    /// "NAME(code): message [file:line:column]"
    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode            code_;
    std::string          message_;
    std::source_location location_;
};

// Result<T>: either a T or an Error.  value() and error() throw
// std::logic_error when called on the wrong alternative.
template <typename T>
class Result {
public:
    Result(const T& val) : storage_(val) {}             // NOLINT implicit
    Result(T&& val) : storage_(std::move(val)) {}       // NOLINT implicit
    Result(const Error& err) : storage_(err) {}         // NOLINT implicit
    Result(Error&& err) : storage_(std::move(err)) {}   // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept {
        return storage_.index() == 0;
    }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        require_value();
        return std::get<0>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        require_value();
        return std::get<0>(storage_);
    }
    [[nodiscard]] T&& value() && {
        require_value();
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const Error& error() const& {
        require_error();
        return std::get<1>(storage_);
    }
    [[nodiscard]] Error&& error() && {
        require_error();
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return ok() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    void require_value() const {
        if (!ok()) {
            throw std::logic_error("Result::value() on error: " +
                                   std::get<1>(storage_).format());
        }
    }
    void require_error() const {
        if (ok()) throw std::logic_error("Result::error() on value");
    }

    std::variant<T, Error> storage_;
};

// Result<void>: success or an Error.
template <>
class Result<void> {
public:
    Result() noexcept = default;
    Result(const Error& err) : error_(err) {}           // NOLINT implicit
    Result(Error&& err) : error_(std::move(err)) {}     // NOLINT implicit

    [[nodiscard]] bool ok() const noexcept { return error_.is_ok(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] const Error& error() const& {
        if (ok()) throw std::logic_error("Result::error() on value");
        return error_;
    }
    [[nodiscard]] Error&& error() && {
        if (ok()) throw std::logic_error("Result::error() on value");
        return std::move(error_);
    }

private:
    Error error_;
};

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// FEETIER_TRY: unwrap a Result or return its error (GCC/Clang
// statement-expression).
//   int h = FEETIER_TRY(half_of(v));
#define FEETIER_TRY(expr)                                                 \
    ({                                                                    \
        auto&& _ft_res = (expr);                                          \
        if (!_ft_res.ok()) return std::move(_ft_res).error();             \
        std::move(_ft_res).value();                                       \
    })

// FEETIER_TRY_ASSIGN: declare @p var from a Result or return its error.
//   FEETIER_TRY_ASSIGN(rec, store.read(key));
#define FEETIER_TRY_ASSIGN(var, expr)                                     \
    auto _ft_tmp_##var = (expr);                                          \
    if (!_ft_tmp_##var.ok())                                              \
        return std::move(_ft_tmp_##var).error();                          \
    auto var = std::move(_ft_tmp_##var).value()

// FEETIER_TRY_VOID: return the error of a failed Result<void>.
#define FEETIER_TRY_VOID(expr)                                            \
    do {                                                                  \
        auto _ft_tmp = (expr);                                            \
        if (!_ft_tmp.ok()) return std::move(_ft_tmp).error();             \
    } while (false)

} // namespace core
