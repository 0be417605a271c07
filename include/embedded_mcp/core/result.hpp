#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace embedded_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> — holds either a value or an error, never both.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    // -- Factories ----------------------------------------------------------

    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    // -- Query --------------------------------------------------------------

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // -- Access -------------------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // -- Monadic ------------------------------------------------------------

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) const& -> std::invoke_result_t<Fn, const T&> {
        using ReturnType = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(storage_));
        }
        return ReturnType::Err(std::get<1>(storage_));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies host-facing failures (lifecycle, config,
// automation backend). Protocol failures are RpcError, see mcp/rpc_error.hpp.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    AlreadyRunning,
    InvalidPort,
    StartupTimeout,
    BindFailed,
    Cancelled,
    Automation,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error reported to the host application.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> detail;

    static Error Make(std::string operation, std::string message,
                      ErrorCategory category) {
        return Error{std::move(operation), std::move(message), category,
                     std::nullopt};
    }

    [[nodiscard]] int ExitCode() const;
    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               category == other.category &&
               detail == other.detail;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace embedded_mcp
