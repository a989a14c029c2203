#ifndef LOGVEC_CORE_RESULT_H_
#define LOGVEC_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "logvec/core/error.h"

namespace logvec {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<std::vector<Vector>> embed(...) {
 *     if (failed) {
 *         return Result<std::vector<Vector>>::error("model unavailable");
 *     }
 *     return vectors;
 * }
 *
 * auto result = embed(...);
 * if (!result.ok()) {
 *     LOGVEC_ERROR("embed failed: {}", result.error());
 * }
 * ```
 *
 * Results are move-only. T must be default constructible.
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)),
          code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        return Result<T>(message, code, ErrorTag{});
    }

private:
    struct ErrorTag {};
    Result(std::string message, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(message)), code_(code) {}

    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() = default;

    bool ok() const { return !error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    Error::Code code() const { return code_; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::UNKNOWN) {
        Result<void> result;
        result.error_msg_ = message;
        result.code_ = code;
        return result;
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace core
} // namespace logvec

#endif // LOGVEC_CORE_RESULT_H_
