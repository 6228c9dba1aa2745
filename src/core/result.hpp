/**
 * @file result.hpp
 * @brief Monadic error handling type and error taxonomy for Cloudlet.
 *
 * Provides Result<T, E> as the primary error-handling mechanism, avoiding
 * exceptions across module boundaries. Error carries a tagged ErrorKind plus
 * the structured context fields each kind needs (blob id, queue name,
 * function name, field errors), discriminated at the call site.
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <optional>
#include <type_traits>
#include <utility>
#include <stdexcept>

namespace cloudlet {

// ─────────────────────────────────────────────
// Error Taxonomy
// ─────────────────────────────────────────────

enum class ErrorKind : uint8_t {
    Generic,
    BlobNotFound,
    BlobOperationFailed,
    QueueOperationFailed,
    QueueQuotaExceeded,
    FunctionExecutionFailed,
    ValidationFailed
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Generic:                 return "generic";
        case ErrorKind::BlobNotFound:            return "blob_not_found";
        case ErrorKind::BlobOperationFailed:     return "blob_operation_failed";
        case ErrorKind::QueueOperationFailed:    return "queue_operation_failed";
        case ErrorKind::QueueQuotaExceeded:      return "queue_quota_exceeded";
        case ErrorKind::FunctionExecutionFailed: return "function_execution_failed";
        case ErrorKind::ValidationFailed:        return "validation_failed";
    }
    return "unknown";
}

using FieldErrors = std::map<std::string, std::vector<std::string>>;

/**
 * @brief Error type carrying a kind, a descriptive message and context.
 *
 * Only the context fields relevant to the kind are populated; the others
 * stay empty.
 */
struct Error {
    ErrorKind kind{ErrorKind::Generic};
    std::string message;

    std::string blob_id;
    std::string queue_name;
    std::string function_name;
    uint64_t max_bytes{0};          ///< Quota that was exceeded (QueueQuotaExceeded)
    FieldErrors field_errors;       ///< ValidationFailed only

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorKind k) const noexcept { return kind == k; }

    // ── Factories ─────────────────────────────

    static Error blob_not_found(std::string id) {
        Error e{ErrorKind::BlobNotFound, "Blob not found: " + id};
        e.blob_id = std::move(id);
        return e;
    }

    static Error blob_operation_failed(std::string id, std::string detail) {
        Error e{ErrorKind::BlobOperationFailed, "Blob operation failed for '" + id + "': " + detail};
        e.blob_id = std::move(id);
        return e;
    }

    static Error queue_operation_failed(std::string queue, std::string detail) {
        Error e{ErrorKind::QueueOperationFailed, "Queue '" + queue + "': " + detail};
        e.queue_name = std::move(queue);
        return e;
    }

    static Error queue_quota_exceeded(std::string queue, uint64_t limit, std::string detail) {
        Error e{ErrorKind::QueueQuotaExceeded, "Queue '" + queue + "' quota exceeded: " + detail};
        e.queue_name = std::move(queue);
        e.max_bytes = limit;
        return e;
    }

    static Error function_execution_failed(std::string function, std::string blob,
                                           std::string detail) {
        Error e{ErrorKind::FunctionExecutionFailed,
                "Function '" + function + "' (blob " + blob + ") failed: " + detail};
        e.function_name = std::move(function);
        e.blob_id = std::move(blob);
        return e;
    }

    static Error validation_failed(std::string field, std::string detail) {
        Error e{ErrorKind::ValidationFailed, field + ": " + detail};
        e.field_errors[std::move(field)].push_back(std::move(detail));
        return e;
    }

    static Error validation_failed(FieldErrors errors) {
        std::string summary = "Validation failed";
        for (const auto& [field, messages] : errors) {
            for (const auto& msg : messages) {
                summary += "; " + field + ": " + msg;
            }
        }
        Error e{ErrorKind::ValidationFailed, std::move(summary)};
        e.field_errors = std::move(errors);
        return e;
    }
};

/**
 * @brief Result<T, E>, a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(std::string message) {
    return Result<T, E>(E{std::move(message)});
}

}  // namespace cloudlet
