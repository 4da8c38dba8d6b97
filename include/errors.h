#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>

namespace optidex {

/**
 * @brief Error types for the failure modes of the controller and its workers
 */
enum class ErrorType {
    None,
    IOError,
    NetworkError,
    ParseError,
    InvalidState,
    ResourceBusy,        ///< Camera already leased; caller may retry
    WorkerSpawnFailure,  ///< Executable missing or exec failed
    WorkerTimeout,       ///< Worker ignored SIGTERM and was killed
    MalformedEvent,      ///< Unparsable structured event line
    StaleCompletion,     ///< Completion arrived for a cancelled turn
    Timeout,
    Unknown
};

/**
 * @brief Human-readable name of an error type (for logs)
 */
inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None: return "None";
        case ErrorType::IOError: return "IOError";
        case ErrorType::NetworkError: return "NetworkError";
        case ErrorType::ParseError: return "ParseError";
        case ErrorType::InvalidState: return "InvalidState";
        case ErrorType::ResourceBusy: return "ResourceBusy";
        case ErrorType::WorkerSpawnFailure: return "WorkerSpawnFailure";
        case ErrorType::WorkerTimeout: return "WorkerTimeout";
        case ErrorType::MalformedEvent: return "MalformedEvent";
        case ErrorType::StaleCompletion: return "StaleCompletion";
        case ErrorType::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }

    std::string to_string() const {
        return std::string(error_type_name(type)) + ": " + message;
    }
};

/**
 * @brief Either a value or the Error that prevented it
 *
 * value() on an error (or error() on a value) throws std::logic_error; check
 * is_ok() first. Collaborator boundaries return these instead of throwing.
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

    const T& value() const {
        if (const T* v = std::get_if<T>(&data_)) return *v;
        throw std::logic_error("value() on failed Result: " + std::get<Error>(data_).to_string());
    }

    T& value() {
        if (T* v = std::get_if<T>(&data_)) return *v;
        throw std::logic_error("value() on failed Result: " + std::get<Error>(data_).to_string());
    }

    const Error& error() const {
        if (const Error* e = std::get_if<Error>(&data_)) return *e;
        throw std::logic_error("error() on successful Result");
    }

    explicit operator bool() const { return is_ok(); }

private:
    std::variant<T, Error> data_;
};

/// Success/failure only
template<>
class Result<void> {
public:
    Result() = default;
    Result(const Error& error) : error_(error) {}
    Result(Error&& error) : error_(std::move(error)) {}

    bool is_ok() const { return !error_.is_error(); }
    bool is_error() const { return error_.is_error(); }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok(); }

private:
    Error error_;
};

using VoidResult = Result<void>;

inline Error make_error(ErrorType type, const std::string& message) {
    return Error(type, message);
}

inline Error make_io_error(const std::string& message) {
    return Error(ErrorType::IOError, message);
}

inline Error make_network_error(const std::string& message) {
    return Error(ErrorType::NetworkError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ParseError, message);
}

inline Error make_busy_error(const std::string& message = "Camera is busy") {
    return Error(ErrorType::ResourceBusy, message);
}

inline Error make_spawn_error(const std::string& message) {
    return Error(ErrorType::WorkerSpawnFailure, message);
}

inline Error make_timeout_error(const std::string& message = "Operation timed out") {
    return Error(ErrorType::Timeout, message);
}

inline Error make_malformed_event_error(const std::string& message) {
    return Error(ErrorType::MalformedEvent, message);
}

/// A completion issued under one turn that arrived after the turn moved on
inline Error make_stale_error(const std::string& what, uint64_t issued_turn, uint64_t current_turn) {
    return Error(ErrorType::StaleCompletion, what + " for turn " + std::to_string(issued_turn) +
                                             " arrived during turn " + std::to_string(current_turn));
}

} // namespace optidex
