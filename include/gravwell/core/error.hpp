#pragma once

/// @file error.hpp
/// @brief Error handling types for gravwell_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace gravwell_core {

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
    DegenerateInput,
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
        case ErrorCode::DegenerateInput: return "DegenerateInput";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Handle errors
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,         // Handle is null
        Stale,        // Handle generation mismatch (already freed)
        OutOfBounds,  // Handle index out of bounds
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError stale() {
        return HandleError{Kind::Stale, "Handle is stale (generation mismatch)"};
    }

    [[nodiscard]] static HandleError out_of_bounds() {
        return HandleError{Kind::OutOfBounds, "Handle index out of bounds"};
    }
};

/// Simulation errors. None of these stop a step; callers substitute a safe default.
struct PhysicsError {
    enum class Kind : std::uint8_t {
        DegenerateInput,    // NaN/inf or zero-size input replaced by a fallback
        MissingBody,        // Body id not registered
        MissingCollidable,  // Collidable id not registered
        InvalidParameter,   // Parameter outside its valid range
    };

    Kind kind;
    std::string message;
    std::string subject;  // What the error is about (body name, field, ...)

    [[nodiscard]] static PhysicsError degenerate_input(const std::string& what) {
        return PhysicsError{Kind::DegenerateInput, "Degenerate input: " + what, what};
    }

    [[nodiscard]] static PhysicsError missing_body(const std::string& id) {
        return PhysicsError{Kind::MissingBody, "Body not registered: " + id, id};
    }

    [[nodiscard]] static PhysicsError missing_collidable(const std::string& id) {
        return PhysicsError{Kind::MissingCollidable, "Collidable not registered: " + id, id};
    }

    [[nodiscard]] static PhysicsError invalid_parameter(const std::string& name, const std::string& reason) {
        return PhysicsError{Kind::InvalidParameter, "Invalid parameter '" + name + "': " + reason, name};
    }
};

/// Configuration and scene loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        Parse,          // Malformed JSON
        MissingField,   // Required field absent or wrong type
        InvalidValue,   // Field present but out of range
        Io,             // File could not be read
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static ConfigError parse(const std::string& reason) {
        return ConfigError{Kind::Parse, "Parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError missing_field(const std::string& field) {
        return ConfigError{Kind::MissingField, "Missing or mistyped field: " + field, field};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& field, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + field + "': " + reason, field};
    }

    [[nodiscard]] static ConfigError io(const std::string& path) {
        return ConfigError{Kind::Io, "Failed to read file: " + path, path};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        HandleError,
        PhysicsError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(HandleError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(PhysicsError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

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
    static ErrorCode to_error_code(HandleError::Kind kind) {
        switch (kind) {
            case HandleError::Kind::Null: return ErrorCode::InvalidArgument;
            case HandleError::Kind::Stale: return ErrorCode::InvalidState;
            case HandleError::Kind::OutOfBounds: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(PhysicsError::Kind kind) {
        switch (kind) {
            case PhysicsError::Kind::DegenerateInput: return ErrorCode::DegenerateInput;
            case PhysicsError::Kind::MissingBody: return ErrorCode::NotFound;
            case PhysicsError::Kind::MissingCollidable: return ErrorCode::NotFound;
            case PhysicsError::Kind::InvalidParameter: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::Parse: return ErrorCode::ParseError;
            case ConfigError::Kind::MissingField: return ErrorCode::ValidationError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
            case ConfigError::Kind::Io: return ErrorCode::IOError;
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

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
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

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

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

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
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

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

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

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, kind and context
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace gravwell_core
