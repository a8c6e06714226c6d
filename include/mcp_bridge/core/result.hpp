#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// Result<T, E>: a discriminated union that holds either a value or an error.
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

    // -- Access (const&) ----------------------------------------------------

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    // -- Access (&&) --------------------------------------------------------

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

    // -- Monadic: Map -------------------------------------------------------
    // fn: T -> U

    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
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
// Result<void, E>: specialization for operations that succeed with no value.
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
// ErrorCategory: classifies errors for exit codes, propagation policy and
// structured output.
//
//   Transport        connection refused, broken pipe, malformed bytes
//   Protocol         handshake failure, unexpected response shape
//   Timeout          no response within the request or readiness deadline
//   UnknownProvider  caller named a provider that is not registered
//   MissingArgument  caller omitted an argument a tool requires
//   ToolExecution    the provider reported an error for a specific call
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Transport,
    Protocol,
    Timeout,
    UnknownProvider,
    MissingArgument,
    ToolExecution,
    Config,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error type for provider operations.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string endpoint;           // provider name, URL path or RPC method
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<int> http_status;
    std::optional<int> rpc_code;

    /// Create an Error from an HTTP status code. Extracts a provider message
    /// from a JSON response body when one is present.
    static Error FromHttpStatus(const std::string& operation,
                                const std::string& endpoint,
                                int status_code,
                                const std::string& response_body = "");

    /// Create an Error from a JSON-RPC error object ({code, message, data}).
    /// The rpc_error argument is the serialized JSON of that object.
    static Error FromRpcError(const std::string& operation,
                              const std::string& endpoint,
                              const std::string& rpc_error);

    /// True for errors that are the caller's fault rather than a runtime
    /// failure of the provider.
    [[nodiscard]] bool IsCallerMisuse() const noexcept {
        return category == ErrorCategory::UnknownProvider ||
               category == ErrorCategory::MissingArgument;
    }

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Transport:       return 1;
            case ErrorCategory::Protocol:        return 2;
            case ErrorCategory::Timeout:         return 3;
            case ErrorCategory::UnknownProvider: return 4;
            case ErrorCategory::MissingArgument: return 5;
            case ErrorCategory::ToolExecution:   return 6;
            case ErrorCategory::Config:          return 7;
            case ErrorCategory::Internal:        return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Transport:       return "transport";
            case ErrorCategory::Protocol:        return "protocol";
            case ErrorCategory::Timeout:         return "timeout";
            case ErrorCategory::UnknownProvider: return "unknown_provider";
            case ErrorCategory::MissingArgument: return "missing_argument";
            case ErrorCategory::ToolExecution:   return "tool_execution";
            case ErrorCategory::Config:          return "config";
            case ErrorCategory::Internal:        return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const;

    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               endpoint == other.endpoint &&
               message == other.message &&
               category == other.category &&
               http_status == other.http_status &&
               rpc_code == other.rpc_code;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace mcp_bridge
