#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace mcp {

// MCP-owned error codes (no FFmpeg codes escape)
enum class ErrorCode {
    Ok,
    FileNotFound,
    Unsupported,
    EngineUnavailable,
    ProbeFailed,
    TranscodeFailed,
    Cancelled,
    InvalidArg,
    Internal
};

inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:                return "Ok";
        case ErrorCode::FileNotFound:      return "FileNotFound";
        case ErrorCode::Unsupported:       return "Unsupported";
        case ErrorCode::EngineUnavailable: return "EngineUnavailable";
        case ErrorCode::ProbeFailed:       return "ProbeFailed";
        case ErrorCode::TranscodeFailed:   return "TranscodeFailed";
        case ErrorCode::Cancelled:         return "Cancelled";
        case ErrorCode::InvalidArg:        return "InvalidArg";
        case ErrorCode::Internal:          return "Internal";
    }
    return "Unknown";
}

// Error with context message
struct Error {
    ErrorCode code;
    std::string message;

    static Error ok() { return {ErrorCode::Ok, ""}; }
    static Error file_not_found(const std::string& path) {
        return {ErrorCode::FileNotFound, "File not found: " + path};
    }
    static Error unsupported(const std::string& detail) {
        return {ErrorCode::Unsupported, detail};
    }
    static Error engine_unavailable(const std::string& detail) {
        return {ErrorCode::EngineUnavailable, detail};
    }
    static Error probe_failed(const std::string& detail) {
        return {ErrorCode::ProbeFailed, detail};
    }
    static Error transcode_failed(const std::string& detail) {
        return {ErrorCode::TranscodeFailed, detail};
    }
    static Error cancelled() {
        return {ErrorCode::Cancelled, "Operation cancelled"};
    }
    static Error invalid_arg(const std::string& detail) {
        return {ErrorCode::InvalidArg, detail};
    }
    static Error internal(const std::string& detail) {
        return {ErrorCode::Internal, detail};
    }
};

// Result type: either value T or Error
template<typename T>
class Result {
public:
    Result(T value) : m_data(std::move(value)) {}
    Result(Error error) : m_data(std::move(error)) {}

    bool is_ok() const { return std::holds_alternative<T>(m_data); }
    bool is_error() const { return std::holds_alternative<Error>(m_data); }

    T& value() { return std::get<T>(m_data); }
    const T& value() const { return std::get<T>(m_data); }

    Error& error() { return std::get<Error>(m_data); }
    const Error& error() const { return std::get<Error>(m_data); }

    // Unwrap value or throw (for convenience)
    T unwrap() {
        if (is_error()) {
            throw std::runtime_error(error().message);
        }
        return std::move(value());
    }

private:
    std::variant<T, Error> m_data;
};

// Specialization for void result
template<>
class Result<void> {
public:
    Result() : m_error(std::nullopt) {}
    Result(Error error) : m_error(std::move(error)) {}

    bool is_ok() const { return !m_error.has_value(); }
    bool is_error() const { return m_error.has_value(); }

    Error& error() { return *m_error; }
    const Error& error() const { return *m_error; }

private:
    std::optional<Error> m_error;
};

} // namespace mcp
