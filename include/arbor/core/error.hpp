#pragma once

/// @file error.hpp
/// @brief Error handling types for arbor_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace arbor_core {

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
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Malformed UI description rejected by reconciliation
struct ReconcileError {
    enum class Kind : std::uint8_t {
        InvalidId,           // Node declared with the null id
        DuplicateId,         // Same id declared twice
        ChildrenNotAllowed,  // Text run or image declared with children
    };

    Kind kind;
    std::string message;
    std::uint64_t node = 0;

    [[nodiscard]] static ReconcileError invalid_id(const std::string& parent) {
        return ReconcileError{Kind::InvalidId, "Node under '" + parent + "' has a null id", 0};
    }

    [[nodiscard]] static ReconcileError duplicate_id(std::uint64_t id) {
        return ReconcileError{Kind::DuplicateId,
            "Duplicate node id " + std::to_string(id) + " in description", id};
    }

    [[nodiscard]] static ReconcileError children_not_allowed(std::uint64_t id, const char* kind_name) {
        return ReconcileError{Kind::ChildrenNotAllowed,
            std::string(kind_name) + " node " + std::to_string(id) + " cannot have children", id};
    }
};

/// Layout engine failures
struct LayoutError {
    enum class Kind : std::uint8_t {
        EngineFailure,      // Engine could not solve the tree
        NonFiniteGeometry,  // Engine produced NaN/inf or negative size
        MissingOutput,      // Engine returned fewer boxes than requested
    };

    Kind kind;
    std::string message;
    std::uint64_t node = 0;

    [[nodiscard]] static LayoutError engine_failure(const std::string& reason) {
        return LayoutError{Kind::EngineFailure, "Layout engine failure: " + reason, 0};
    }

    [[nodiscard]] static LayoutError non_finite(std::uint64_t id) {
        return LayoutError{Kind::NonFiniteGeometry,
            "Non-finite geometry for node " + std::to_string(id), id};
    }

    [[nodiscard]] static LayoutError missing_output(std::size_t expected, std::size_t found) {
        return LayoutError{Kind::MissingOutput,
            "Layout engine returned " + std::to_string(found) + " boxes, expected " +
            std::to_string(expected), 0};
    }
};

/// Image request failures
struct ImageLoadError {
    enum class Kind : std::uint8_t {
        NotFound,      // Source could not be located
        DecodeFailed,  // Source located but not decodable
        Unsupported,   // Unknown format
    };

    Kind kind;
    std::string message;
    std::string source;

    [[nodiscard]] static ImageLoadError not_found(const std::string& src) {
        return ImageLoadError{Kind::NotFound, "Image not found: " + src, src};
    }

    [[nodiscard]] static ImageLoadError decode_failed(const std::string& src, const std::string& reason) {
        return ImageLoadError{Kind::DecodeFailed, "Failed to decode '" + src + "': " + reason, src};
    }

    [[nodiscard]] static ImageLoadError unsupported(const std::string& src) {
        return ImageLoadError{Kind::Unsupported, "Unsupported image format: " + src, src};
    }
};

/// Configuration loading failures
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseError,    // Malformed document
        InvalidValue,  // Wrong type or out-of-range value
        IOError,       // File could not be read
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, key};
    }

    [[nodiscard]] static ConfigError io_error(const std::string& path) {
        return ConfigError{Kind::IOError, "Failed to open config file: " + path, {}};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ReconcileError,
        LayoutError,
        ImageLoadError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ReconcileError err) : m_code(ErrorCode::ValidationError), m_error(std::move(err)) {}
    Error(LayoutError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ImageLoadError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    static ErrorCode to_error_code(LayoutError::Kind kind) {
        switch (kind) {
            case LayoutError::Kind::EngineFailure: return ErrorCode::InvalidState;
            case LayoutError::Kind::NonFiniteGeometry: return ErrorCode::ValidationError;
            case LayoutError::Kind::MissingOutput: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ImageLoadError::Kind kind) {
        switch (kind) {
            case ImageLoadError::Kind::NotFound: return ErrorCode::NotFound;
            case ImageLoadError::Kind::DecodeFailed: return ErrorCode::ParseError;
            case ImageLoadError::Kind::Unsupported: return ErrorCode::NotSupported;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
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

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with kind details and context
std::string build_error_chain(const Error& error);

} // namespace arbor_core
