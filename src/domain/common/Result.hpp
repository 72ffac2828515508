/**
 * @file Result.hpp
 * @brief Typed success/failure return used across the domain and application layers.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace glucosetrail::domain {

/**
 * @enum ErrorKind
 * @brief Coarse classification of a failure, independent of its code.
 */
enum class ErrorKind {
    InvalidInput,     ///< Value object construction failed.
    FutureTimestamp,  ///< Event time is after the clock's "now".
    NotFound,
    Forbidden,
    InvalidType,      ///< Operation requires a specific event variant.
    UpstreamFailure,  ///< Glucose source or event store failed.
    InvalidRange,     ///< Unsupported chart duration selector.
    Cancelled
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::FutureTimestamp: return "FutureTimestamp";
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Forbidden: return "Forbidden";
        case ErrorKind::InvalidType: return "InvalidType";
        case ErrorKind::UpstreamFailure: return "UpstreamFailure";
        case ErrorKind::InvalidRange: return "InvalidRange";
        case ErrorKind::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

/**
 * @struct Error
 * @brief A failure with a stable code (e.g. "Event.InvalidCarbohydrates") and a readable message.
 */
struct Error {
    std::string code;
    std::string message;
    ErrorKind kind = ErrorKind::InvalidInput;

    bool operator==(const Error& other) const {
        return code == other.code && message == other.message && kind == other.kind;
    }
    bool operator!=(const Error& other) const { return !(*this == other); }
};

/**
 * @class Result
 * @brief Holds either a value of type T or an Error.
 *
 * Accessing the wrong alternative is a programming error and throws std::logic_error.
 */
template <typename T>
class Result {
public:
    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(Error error) : m_state(std::in_place_index<1>, std::move(error)) {}

    static Result success(T value) { return Result(std::move(value)); }
    static Result failure(Error error) { return Result(std::move(error)); }

    bool isSuccess() const { return m_state.index() == 0; }
    bool isFailure() const { return m_state.index() == 1; }
    explicit operator bool() const { return isSuccess(); }

    const T& value() const& {
        if (isFailure()) {
            throw std::logic_error("Result: cannot access value of a failed result (" + std::get<1>(m_state).code + ").");
        }
        return std::get<0>(m_state);
    }

    T& value() & {
        if (isFailure()) {
            throw std::logic_error("Result: cannot access value of a failed result (" + std::get<1>(m_state).code + ").");
        }
        return std::get<0>(m_state);
    }

    T&& value() && {
        if (isFailure()) {
            throw std::logic_error("Result: cannot access value of a failed result (" + std::get<1>(m_state).code + ").");
        }
        return std::get<0>(std::move(m_state));
    }

    const Error& error() const {
        if (isSuccess()) {
            throw std::logic_error("Result: successful result has no error.");
        }
        return std::get<1>(m_state);
    }

private:
    std::variant<T, Error> m_state;
};

} // namespace glucosetrail::domain
