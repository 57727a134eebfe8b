#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace vsearch_deploy {

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
// ErrorCategory — classifies errors for exit codes and structured output.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Usage,
    MissingConfig,
    InvalidConfig,
    ToolMissing,
    ConfirmationDeclined,
    PropagationTimeout,
    PermissionGrant,
    ResourceCreation,
    Build,
    Deploy,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error type for every stage of a deployment run.
//
// `detail` carries the diagnostic text of the external tool that failed,
// verbatim, so the operator can decide whether a re-run will help.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::string message;
    std::optional<std::string> detail;
    ErrorCategory category = ErrorCategory::Internal;
    std::optional<std::string> hint;

    /// Build an Error from a failed external command. Picks the most specific
    /// line of the tool's stderr (gcloud prefixes it with "ERROR:") as the
    /// message and keeps the full text in `detail`.
    static Error FromCommandFailure(const std::string& operation,
                                    const std::string& target,
                                    ErrorCategory category,
                                    int exit_code,
                                    const std::string& diagnostic);

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Usage:                return 2;
            case ErrorCategory::MissingConfig:        return 3;
            case ErrorCategory::InvalidConfig:        return 3;
            case ErrorCategory::ToolMissing:          return 4;
            case ErrorCategory::PropagationTimeout:   return 5;
            case ErrorCategory::PermissionGrant:      return 6;
            case ErrorCategory::ResourceCreation:     return 7;
            case ErrorCategory::Build:                return 8;
            case ErrorCategory::Deploy:               return 9;
            case ErrorCategory::ConfirmationDeclined: return 12;
            case ErrorCategory::Internal:             return 99;
        }
        return 99;
    }

    // Operator cancellation is a clean abort, not a failure.
    [[nodiscard]] bool IsCancellation() const noexcept {
        return category == ErrorCategory::ConfirmationDeclined;
    }

    [[nodiscard]] std::string CategoryName() const;
    [[nodiscard]] std::string ToString() const;
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               detail == other.detail &&
               category == other.category &&
               hint == other.hint;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace vsearch_deploy
