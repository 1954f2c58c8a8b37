#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace call_relay {

/**
 * @brief Failure kinds surfaced across the relay, devices and collaborators
 */
enum class ErrorType {
    None,
    DeviceError,      ///< Device not found or stream open/read failure
    TransportError,   ///< Relay connect/send failure
    PipelineError,    ///< Transcription/chat/synthesis failure (generic)
    EmptyPayload,     ///< Collaborator called with nothing to work on
    Unreachable,      ///< Collaborator transport failure or timeout
    BadResponse,      ///< Collaborator answered with an error status or unusable body
    ProtocolError,    ///< Malformed inbound relay payload
    ConfigError,
    InvalidState,
    Timeout
};

inline const char* error_type_name(ErrorType type);

/**
 * @brief A failure kind plus a human-readable message
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// "TypeName: message", for logs and HTTP error bodies
    std::string describe() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Either a T or the Error explaining why there is none
 *
 * value() on a failed result throws std::logic_error; check first.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    const T& value() const {
        require(is_ok(), "value() on failed Result: ");
        return std::get<0>(data_);
    }

    T& value() {
        require(is_ok(), "value() on failed Result: ");
        return std::get<0>(data_);
    }

    const Error& error() const {
        require(is_error(), "error() on successful Result");
        return std::get<1>(data_);
    }

    T value_or(const T& fallback) const {
        return is_ok() ? std::get<0>(data_) : fallback;
    }

private:
    void require(bool holds, const char* what) const {
        if (holds) return;
        std::string text(what);
        if (is_error()) text += std::get<1>(data_).message;
        throw std::logic_error(text);
    }

    std::variant<T, Error> data_;
};

/// Success or an Error, nothing else to carry
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

// Shorthands for the common kinds
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_device_error(const std::string& message) {
    return Error(ErrorType::DeviceError, message);
}

inline Error make_transport_error(const std::string& message) {
    return Error(ErrorType::TransportError, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolError, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::DeviceError: return "DeviceError";
        case ErrorType::TransportError: return "TransportError";
        case ErrorType::PipelineError: return "PipelineError";
        case ErrorType::EmptyPayload: return "EmptyPayload";
        case ErrorType::Unreachable: return "Unreachable";
        case ErrorType::BadResponse: return "BadResponse";
        case ErrorType::ProtocolError: return "ProtocolError";
        case ErrorType::ConfigError: return "ConfigError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::Timeout: return "Timeout";
    }
    return "Unknown";
}

} // namespace call_relay
