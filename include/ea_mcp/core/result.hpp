#pragma once

#include <cassert>
#include <cstddef>
#include <iosfwd>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ea_mcp {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

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
// Result<void, E> — specialization for operations that succeed with no value.
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
// ErrorKind — the error taxonomy reported to MCP callers.
//
// Validation kinds are produced before any repository contact. Connection
// errors come from the session and are never retried here. The two creation
// kinds come from the diagram builders.
// ---------------------------------------------------------------------------
enum class ErrorKind {
    MissingParameter,
    InvalidParameter,
    InvalidGuid,
    UnknownElementType,
    EaConnection,
    NotFound,
    DiagramCreationFailed,
    ElementCreationFailed,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type shared by every layer.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
    std::optional<std::string> field;   // offending parameter path
    std::optional<std::size_t> index;   // position in the offending array
    std::optional<std::string> value;   // offending value as received
    std::vector<std::string> allowed;   // accepted values, when finite

    static Error MissingParameter(const std::string& operation,
                                  const std::string& field);
    static Error InvalidParameter(const std::string& operation,
                                  const std::string& field,
                                  const std::string& message);
    static Error InvalidGuid(const std::string& operation,
                             const std::string& field,
                             const std::string& value);
    static Error UnknownElementType(const std::string& operation,
                                    const std::string& field,
                                    const std::string& value,
                                    std::vector<std::string> allowed);
    static Error EaConnection(const std::string& operation,
                              const std::string& message);
    static Error NotFound(const std::string& operation,
                          const std::string& message);
    static Error DiagramCreationFailed(const std::string& operation,
                                       const std::string& reason);
    static Error ElementCreationFailed(const std::string& operation,
                                       const std::string& field,
                                       std::size_t index,
                                       const std::string& reason);
    static Error Config(const std::string& message);
    static Error Internal(const std::string& operation,
                          const std::string& message);

    [[nodiscard]] bool IsValidation() const noexcept {
        return kind == ErrorKind::MissingParameter ||
               kind == ErrorKind::InvalidParameter ||
               kind == ErrorKind::InvalidGuid ||
               kind == ErrorKind::UnknownElementType;
    }

    // Process exit code used when a startup step fails.
    [[nodiscard]] int ExitCode() const noexcept;

    [[nodiscard]] std::string KindName() const;

    [[nodiscard]] std::string ToString() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e);

    bool operator==(const Error& other) const {
        return operation == other.operation && kind == other.kind &&
               message == other.message && field == other.field &&
               index == other.index && value == other.value &&
               allowed == other.allowed;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace ea_mcp
