#pragma once

#include <string>
#include <variant>
#include <stdexcept>
#include <utility>

namespace samaira {

/**
 * @brief Error kinds for the duplex pipeline
 *
 * Everything except TransportClosed is turn-scoped: the session survives it.
 */
enum class ErrorType {
    None,
    TransportClosed,    ///< Peer disconnected; session is torn down
    EngineTransient,    ///< Engine call failed but may succeed on retry
    EngineFatal,        ///< Engine misconfigured or unavailable; never retried
    ProtocolViolation,  ///< Malformed or unexpected client message; message ignored
    CapacityExceeded,   ///< Frame queue overflow or session limit reached
    TurnTimeout,        ///< Turn exceeded its maximum duration
    Cancelled,          ///< Cooperative cancellation observed
    InvalidConfig       ///< Configuration could not be loaded or validated
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    T value_or(const T& default_value) const {
        return is_ok() ? std::get<T>(data_) : default_value;
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
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

// Helper functions for creating errors
inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_transient_error(const std::string& message) {
    return Error(ErrorType::EngineTransient, message);
}

inline Error make_fatal_error(const std::string& message) {
    return Error(ErrorType::EngineFatal, message);
}

inline Error make_protocol_error(const std::string& message) {
    return Error(ErrorType::ProtocolViolation, message);
}

inline Error make_capacity_error(const std::string& message) {
    return Error(ErrorType::CapacityExceeded, message);
}

inline Error make_cancelled_error(const std::string& message = "Operation cancelled") {
    return Error(ErrorType::Cancelled, message);
}

inline Error make_timeout_error(const std::string& message = "Turn timed out") {
    return Error(ErrorType::TurnTimeout, message);
}

inline Error make_config_error(const std::string& message) {
    return Error(ErrorType::InvalidConfig, message);
}

/**
 * @brief Stable wire name for an error kind (the `kind` field of an error message)
 */
inline const char* error_kind_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "none";
        case ErrorType::TransportClosed: return "transport_closed";
        case ErrorType::EngineTransient: return "engine_transient";
        case ErrorType::EngineFatal: return "engine_fatal";
        case ErrorType::ProtocolViolation: return "protocol_violation";
        case ErrorType::CapacityExceeded: return "capacity_exceeded";
        case ErrorType::TurnTimeout: return "turn_timeout";
        case ErrorType::Cancelled: return "cancelled";
        case ErrorType::InvalidConfig: return "invalid_config";
    }
    return "unknown";
}

/**
 * @brief Whether the client may usefully retry the turn after this error
 */
inline bool is_retryable(ErrorType type) {
    return type == ErrorType::EngineTransient || type == ErrorType::TurnTimeout ||
           type == ErrorType::CapacityExceeded;
}

} // namespace samaira
