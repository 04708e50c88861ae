#ifndef HYPERDB_CORE_ERROR_H_
#define HYPERDB_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace hyperdb {
namespace core {

/**
 * @brief Base class for all hyperdb errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        REENTRANT_INSERT = 7,
        EPOCH_NOT_FOUND = 8,
        PARTITION_NOT_FOUND = 9,
        TRANSACTION_ABORTED = 10
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Stable five-character state string for an error code.
 *
 * The HD5xx class marks catalog inconsistencies that cannot happen under a
 * consistent catalog; callers use it to tell internal bugs apart from
 * ordinary user errors.
 */
const char* state_code(Error::Code code);

/**
 * @brief True for codes in the HD5xx "should never happen" class
 */
bool is_internal_inconsistency(Error::Code code);

const char* code_name(Error::Code code);

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
    explicit NotFoundError(const char* message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating resource already exists
 */
class AlreadyExistsError : public Error {
public:
    explicit AlreadyExistsError(const std::string& message)
        : Error(message, Code::ALREADY_EXISTS) {}
    explicit AlreadyExistsError(const char* message)
        : Error(message, Code::ALREADY_EXISTS) {}
};

/**
 * @brief Error indicating internal error
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
    explicit InternalError(const char* message)
        : Error(message, Code::INTERNAL) {}
};

} // namespace core
} // namespace hyperdb

#endif // HYPERDB_CORE_ERROR_H_
