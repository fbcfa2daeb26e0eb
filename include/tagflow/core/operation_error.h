#pragma once

#include <tagflow/core/types.h>

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace tagflow {

// Carries an Error across boundaries that propagate failures as exceptions,
// such as AsyncTask chains and database bridge callbacks.
class OperationError : public std::runtime_error {
public:
    explicit OperationError(Error error)
        : std::runtime_error(error.message), error_(std::move(error)) {}

    OperationError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), error_(code, message) {}

    [[nodiscard]] const Error& error() const noexcept { return error_; }
    [[nodiscard]] ErrorCode code() const noexcept { return error_.code; }

private:
    Error error_;
};

/**
 * @brief Convert a captured failure back into an Error.
 *
 * OperationError keeps its code and message. Any other std::exception maps to
 * InternalError with its what() text.
 */
Error toError(const std::exception_ptr& failure);

// Shorthand for toError(failure).code
ErrorCode errorCodeOf(const std::exception_ptr& failure);

/**
 * @brief Return the value of a Result or throw its error as OperationError.
 */
template <typename T> T unwrap(Result<T> result) {
    if (!result) {
        throw OperationError(result.error());
    }
    return std::move(result).value();
}

} // namespace tagflow
