#ifndef PROVMARK_ERRORS_HPP
#define PROVMARK_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ProvMark {

/**
 * @brief Base class for all ProvMark exceptions.
 */
class Exception : public std::exception {
public:
    explicit Exception(const std::string& message) : msg_(message) {}
    explicit Exception(const char* message) : msg_(message) {}
    virtual ~Exception() noexcept override = default;

    virtual const char* what() const noexcept override {
        return msg_.c_str();
    }

protected:
    std::string msg_;
};

/**
 * @brief Exception for errors that occur at runtime.
 */
class RuntimeError : public Exception {
public:
    explicit RuntimeError(const std::string& message) : Exception(message) {}
    explicit RuntimeError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for logic errors in the library's usage.
 */
class LogicError : public Exception {
public:
    explicit LogicError(const std::string& message) : Exception(message) {}
    explicit LogicError(const char* message) : Exception(message) {}
};

/**
 * @brief Exception for invalid arguments.
 */
class InvalidArgument : public LogicError {
public:
    explicit InvalidArgument(const std::string& message) : LogicError(message) {}
    explicit InvalidArgument(const char* message) : LogicError(message) {}
};

/**
 * @brief Input rejected before any cryptographic work was done
 *        (bad hex, wrong key length, unsupported image, missing fields).
 */
class MalformedInput : public InvalidArgument {
public:
    explicit MalformedInput(const std::string& message) : InvalidArgument(message) {}
    explicit MalformedInput(const char* message) : InvalidArgument(message) {}
};

/**
 * @brief The secure random source could not be initialised.
 *        Key generation is aborted, never degraded.
 */
class RandomSourceUnavailable : public RuntimeError {
public:
    explicit RandomSourceUnavailable(const std::string& message) : RuntimeError(message) {}
    explicit RandomSourceUnavailable(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Failure of the backing record store (I/O, corrupt file).
 */
class StoreError : public RuntimeError {
public:
    explicit StoreError(const std::string& message) : RuntimeError(message) {}
    explicit StoreError(const char* message) : RuntimeError(message) {}
};

/**
 * @brief Reportable outcomes. These travel as values (and on the wire),
 *        they are not thrown.
 */
enum class ErrorCode : uint16_t {
    OK = 0,
    MALFORMED_INPUT = 1,
    HASH_MISMATCH = 2,
    SIGNATURE_INVALID = 3,
    ACTION_EXPIRED = 4,
    NOT_FOUND = 5,
    INTERNAL = 6
};

const char* to_string(ErrorCode code);

} // namespace ProvMark

#endif // PROVMARK_ERRORS_HPP
