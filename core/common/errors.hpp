#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace reasongraph {

// ─── Error Codes ───────────────────────────────────────────────
// Stable codes handed to the adapter layer. Retryability is a property
// of the code, not of the individual throw site.

enum class ErrorCode {
    InvalidInput,
    MissingParameter,
    BranchNotFound,
    ThoughtNotFound,
    ConfigurationError,
    SemanticAnalysisError,
    ProviderTimeout,
    ImportFailed,
    ExportFailed,
    InternalError
};

const char* errorCodeName(ErrorCode code);
bool isRetryable(ErrorCode code);

// ─── Exception Hierarchy ──────────────────────────────────────

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }
    bool retryable() const { return isRetryable(code_); }

private:
    ErrorCode code_;
};

/// Bad caller input. Always raised before any mutation.
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message,
                             ErrorCode code = ErrorCode::InvalidInput)
        : Error(code, message) {}
};

/// A referenced branch or thought does not exist.
class NotFoundError : public Error {
public:
    NotFoundError(ErrorCode code, const std::string& message)
        : Error(code, message) {}

    static NotFoundError branch(const std::string& branch_id) {
        return NotFoundError(ErrorCode::BranchNotFound, "Branch not found: " + branch_id);
    }
    static NotFoundError thought(const std::string& thought_id) {
        return NotFoundError(ErrorCode::ThoughtNotFound, "Thought not found: " + thought_id);
    }
};

class ConfigurationError : public Error {
public:
    ConfigurationError(const std::string& setting, const std::string& details)
        : Error(ErrorCode::ConfigurationError,
                "Configuration error in " + setting + ": " + details) {}
};

/// Failure or timeout at the embedding boundary.
class ProviderError : public Error {
public:
    explicit ProviderError(const std::string& message,
                           ErrorCode code = ErrorCode::SemanticAnalysisError)
        : Error(code, message) {}
};

class ImportError : public Error {
public:
    explicit ImportError(const std::string& reason)
        : Error(ErrorCode::ImportFailed, "Import failed: " + reason) {}
};

class ExportError : public Error {
public:
    explicit ExportError(const std::string& reason)
        : Error(ErrorCode::ExportFailed, "Export failed: " + reason) {}
};

// ─── Structured Outcome ────────────────────────────────────────
// Uniform success/failure value for the boundary layer.

struct ErrorInfo {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    bool retryable = true;
};

/// Map any exception onto an ErrorInfo. Non-library exceptions become
/// INTERNAL_ERROR, which is retryable.
ErrorInfo describe(const std::exception& e);

template <typename T>
class Outcome {
public:
    static Outcome success(T value) {
        Outcome out;
        out.result_ = std::move(value);
        return out;
    }

    static Outcome failure(ErrorInfo info) {
        Outcome out;
        out.result_ = std::move(info);
        return out;
    }

    bool ok() const { return std::holds_alternative<T>(result_); }
    const T& value() const { return std::get<T>(result_); }
    T& value() { return std::get<T>(result_); }
    const ErrorInfo& error() const { return std::get<ErrorInfo>(result_); }

private:
    Outcome() = default;
    std::variant<T, ErrorInfo> result_;
};

/// Run fn and convert its result (or the exception it throws) into an
/// Outcome. A void fn yields Outcome<std::monostate>.
template <typename Fn>
auto capture(Fn&& fn) {
    using R = std::invoke_result_t<Fn>;
    if constexpr (std::is_void_v<R>) {
        try {
            fn();
            return Outcome<std::monostate>::success(std::monostate{});
        } catch (const std::exception& e) {
            return Outcome<std::monostate>::failure(describe(e));
        }
    } else {
        try {
            return Outcome<R>::success(fn());
        } catch (const std::exception& e) {
            return Outcome<R>::failure(describe(e));
        }
    }
}

} // namespace reasongraph
