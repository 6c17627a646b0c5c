#pragma once
/**
 * @file result.h
 * @brief Two-channel operation results
 *
 * Every fallible bridge operation returns a value together with an optional
 * human-readable error. When an error is present the value must be ignored.
 *
 * @code
 * Result<Handle> r = functions.compile(source, "add");
 * if (!r) {
 *     std::cerr << error_kind_to_string(r.kind()) << ": " << r.error() << "\n";
 * }
 * @endcode
 */

#include "cbridge/core/types.h"
#include <optional>
#include <string>
#include <utility>

namespace cbridge {

/**
 * @brief Failure taxonomy
 */
enum class ErrorKind : UInt8 {
    None           = 0,
    Initialization = 1,   ///< No device, or the device could not be opened
    Compilation    = 2,   ///< Source, entry point or pipeline set-up failed
    Allocation     = 3,   ///< Invalid size or out of device memory
    Lookup         = 4,   ///< Unknown or released handle
    Dispatch       = 5    ///< Invalid grid or device execution error
};

const char* error_kind_to_string(ErrorKind kind);

template <typename T>
class Result;

/**
 * @brief Failure half of a Result, convertible to any Result<T>
 */
class Failure {
public:
    Failure(ErrorKind kind, std::string message)
        : m_kind(kind), m_message(std::move(message)) {}

    ErrorKind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }

private:
    ErrorKind m_kind;
    std::string m_message;
};

inline Failure make_error(ErrorKind kind, std::string message) {
    return Failure(kind, std::move(message));
}

/**
 * @brief Value or failure
 */
template <typename T>
class Result {
public:
    Result(T value) : m_value(std::move(value)) {}

    Result(Failure failure)
        : m_kind(failure.kind()), m_error(failure.message()) {}

    bool ok() const { return m_kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    ErrorKind kind() const { return m_kind; }

    /**
     * @brief Error message; empty on success
     */
    const std::string& error() const { return m_error; }

    /**
     * @brief Stored value; only meaningful when ok()
     */
    const T& value() const& { return *m_value; }
    T& value() & { return *m_value; }
    T&& value() && { return std::move(*m_value); }

    T value_or(T fallback) const {
        return ok() ? *m_value : std::move(fallback);
    }

    /**
     * @brief Same failure with the message prefixed (e.g. "Unable to ...: ")
     */
    Failure with_context(const std::string& prefix) const {
        return Failure(m_kind, prefix + m_error);
    }

    Failure failure() const {
        return Failure(m_kind, m_error);
    }

private:
    std::optional<T> m_value;
    ErrorKind m_kind{ErrorKind::None};
    std::string m_error;
};

/**
 * @brief Result without a value
 */
template <>
class Result<void> {
public:
    Result() = default;

    Result(Failure failure)
        : m_kind(failure.kind()), m_error(failure.message()) {}

    bool ok() const { return m_kind == ErrorKind::None; }
    explicit operator bool() const { return ok(); }

    ErrorKind kind() const { return m_kind; }
    const std::string& error() const { return m_error; }

    Failure with_context(const std::string& prefix) const {
        return Failure(m_kind, prefix + m_error);
    }

    Failure failure() const {
        return Failure(m_kind, m_error);
    }

private:
    ErrorKind m_kind{ErrorKind::None};
    std::string m_error;
};

using Status = Result<void>;

inline Status success() {
    return Status{};
}

} // namespace cbridge
