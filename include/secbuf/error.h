#ifndef SECBUF_ERROR_H
#define SECBUF_ERROR_H

#include <secbuf/config.h>
#include <system_error>
#include <string>
#include <cstdint>

namespace secbuf {

// secbuf error codes
enum class SecbufError : int {
    SUCCESS = 0,

    // General errors (1-19)
    INVALID_PARAMETER = 1,
    OUT_OF_MEMORY = 2,
    NOT_INITIALIZED = 3,
    INTERNAL_ERROR = 4,

    // Linear buffer errors (20-39)
    CAPACITY_EXCEEDED = 20,
    UNDERFLOW_ERROR = 21,
    MALFORMED_LENGTH = 22,
    OUT_OF_RANGE = 23,

    // Streaming and queueing errors (40-59)
    BUFFER_FULL = 40,
    QUEUE_FULL = 41,

    // Configuration errors (60-79)
    INVALID_CONFIGURATION = 60,

    // Diagnostics errors (80-99)
    RATE_LIMITED = 80
};

// Error category for secbuf errors
class SecbufErrorCategory : public std::error_category {
public:
    const char* name() const noexcept override {
        return "secbuf";
    }

    std::string message(int ev) const override;

    static const SecbufErrorCategory& instance() {
        static SecbufErrorCategory instance;
        return instance;
    }
};

inline std::error_code make_error_code(SecbufError e) {
    return std::error_code(static_cast<int>(e), SecbufErrorCategory::instance());
}

// Exception class for secbuf errors
class SECBUF_API SecbufException : public std::system_error {
public:
    explicit SecbufException(SecbufError error)
        : std::system_error(make_error_code(error)) {}

    SecbufException(SecbufError error, const std::string& what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    SecbufException(SecbufError error, const char* what_arg)
        : std::system_error(make_error_code(error), what_arg) {}

    SecbufError secbuf_error() const noexcept {
        return static_cast<SecbufError>(code().value());
    }
};

// Utility functions
SECBUF_API std::string error_message(SecbufError error);

/**
 * Errors the caller can resolve by draining and retrying
 * (BUFFER_FULL, QUEUE_FULL, RATE_LIMITED).
 */
SECBUF_API bool is_retryable_error(SecbufError error) noexcept;

/**
 * Errors that signal corrupted input rather than caller misuse.
 */
SECBUF_API bool is_protocol_error(SecbufError error) noexcept;

#define SECBUF_THROW_IF_ERROR(error) \
    do { \
        if ((error) != ::secbuf::SecbufError::SUCCESS) { \
            throw ::secbuf::SecbufException((error)); \
        } \
    } while (0)

#define SECBUF_RETURN_IF_ERROR(result) \
    do { \
        if (!(result).is_success()) { \
            return (result).error(); \
        } \
    } while (0)

} // namespace secbuf

namespace std {
template<>
struct is_error_code_enum<secbuf::SecbufError> : true_type {};
}

#endif // SECBUF_ERROR_H
