#pragma once

/// @file error.hpp
/// @brief Error handling types for crowd_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace crowd_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    BackendFailure,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::BackendFailure: return "BackendFailure";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Template graph construction and validation errors
struct TemplateError {
    enum class Kind : std::uint8_t {
        InvalidGraph,       // Validation reported at least one issue
        UnknownNodeType,    // Type identifier not in the registry
        DuplicateNode,      // Two nodes share an id
        DanglingInput,      // Input slot references a missing node
        CyclicGraph,        // Input references form a cycle
        NotValidated,       // Build requested before validation
    };

    Kind kind;
    std::string message;
    std::string node_id;

    [[nodiscard]] static TemplateError invalid_graph(std::size_t issue_count) {
        return TemplateError{Kind::InvalidGraph,
            "Graph failed validation with " + std::to_string(issue_count) + " issue(s)", {}};
    }

    [[nodiscard]] static TemplateError unknown_node_type(const std::string& node, const std::string& type) {
        return TemplateError{Kind::UnknownNodeType,
            "Node '" + node + "' has unknown type: " + type, node};
    }

    [[nodiscard]] static TemplateError duplicate_node(const std::string& node) {
        return TemplateError{Kind::DuplicateNode, "Duplicate node id: " + node, node};
    }

    [[nodiscard]] static TemplateError dangling_input(const std::string& node, const std::string& slot) {
        return TemplateError{Kind::DanglingInput,
            "Node '" + node + "' input '" + slot + "' references a missing node", node};
    }

    [[nodiscard]] static TemplateError cyclic_graph(const std::string& node) {
        return TemplateError{Kind::CyclicGraph, "Cycle detected through node: " + node, node};
    }

    [[nodiscard]] static TemplateError not_validated() {
        return TemplateError{Kind::NotValidated, "Graph must be validated before building", {}};
    }
};

/// Scene backend call failures
struct BackendError {
    enum class Kind : std::uint8_t {
        NotFound,         // Referenced entity is missing
        OperationFailed,  // Backend refused or failed the operation
        Unreachable,      // External resource cannot be reached
    };

    Kind kind;
    std::string message;
    std::string operation;

    [[nodiscard]] static BackendError not_found(const std::string& op, const std::string& name) {
        return BackendError{Kind::NotFound, op + ": not found: " + name, op};
    }

    [[nodiscard]] static BackendError operation_failed(const std::string& op, const std::string& reason) {
        return BackendError{Kind::OperationFailed, op + " failed: " + reason, op};
    }

    [[nodiscard]] static BackendError unreachable(const std::string& op, const std::string& resource) {
        return BackendError{Kind::Unreachable, op + ": cannot reach " + resource, op};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        TemplateError,
        BackendError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(TemplateError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(BackendError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(TemplateError::Kind kind) {
        switch (kind) {
            case TemplateError::Kind::InvalidGraph: return ErrorCode::ValidationError;
            case TemplateError::Kind::UnknownNodeType: return ErrorCode::NotFound;
            case TemplateError::Kind::DuplicateNode: return ErrorCode::AlreadyExists;
            case TemplateError::Kind::DanglingInput: return ErrorCode::NotFound;
            case TemplateError::Kind::CyclicGraph: return ErrorCode::InvalidArgument;
            case TemplateError::Kind::NotValidated: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(BackendError::Kind kind) {
        switch (kind) {
            case BackendError::Kind::NotFound: return ErrorCode::NotFound;
            case BackendError::Kind::OperationFailed: return ErrorCode::BackendFailure;
            case BackendError::Kind::Unreachable: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type holding either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace crowd_core
