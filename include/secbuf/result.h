#ifndef SECBUF_RESULT_H
#define SECBUF_RESULT_H

#include <secbuf/config.h>
#include <secbuf/error.h>
#include <variant>
#include <utility>
#include <type_traits>

namespace secbuf {

/**
 * Outcome of a buffer operation: a value of type T or a SecbufError.
 *
 * Fallible buffer, ring and queue operations return a Result instead of
 * throwing. Reaching for the value of a failed Result throws
 * SecbufException carrying its error code.
 */
template<typename T>
class Result {
public:
    Result(T value) : outcome_(std::move(value)) {}
    Result(SecbufError error) : outcome_(error) {}

    bool is_success() const noexcept { return outcome_.index() == 0; }
    bool is_error() const noexcept { return outcome_.index() == 1; }
    explicit operator bool() const noexcept { return is_success(); }

    // SUCCESS when a value is held
    SecbufError error() const noexcept {
        const SecbufError* error = std::get_if<SecbufError>(&outcome_);
        return error ? *error : SecbufError::SUCCESS;
    }

    const T& value() const & { return checked(); }
    T& value() & { return checked(); }
    T value() && { return std::move(checked()); }

    const T& operator*() const & { return checked(); }
    T& operator*() & { return checked(); }
    T operator*() && { return std::move(checked()); }

    const T* operator->() const { return &checked(); }
    T* operator->() { return &checked(); }

private:
    std::variant<T, SecbufError> outcome_;

    const T& checked() const {
        if (const SecbufError* error = std::get_if<SecbufError>(&outcome_)) {
            throw SecbufException(*error);
        }
        return std::get<0>(outcome_);
    }

    T& checked() {
        if (const SecbufError* error = std::get_if<SecbufError>(&outcome_)) {
            throw SecbufException(*error);
        }
        return std::get<0>(outcome_);
    }
};

// Outcome of an operation with nothing to return
template<>
class Result<void> {
public:
    Result() : error_(SecbufError::SUCCESS) {}
    Result(SecbufError error) : error_(error) {}

    bool is_success() const noexcept { return error_ == SecbufError::SUCCESS; }
    bool is_error() const noexcept { return !is_success(); }
    explicit operator bool() const noexcept { return is_success(); }

    SecbufError error() const noexcept { return error_; }

private:
    SecbufError error_;
};

template<typename T>
Result<std::decay_t<T>> make_result(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

inline Result<void> make_result() {
    return Result<void>();
}

template<typename T>
Result<T> make_error(SecbufError error) {
    return Result<T>(error);
}

} // namespace secbuf

#endif // SECBUF_RESULT_H
