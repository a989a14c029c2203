#ifndef LOGVEC_CORE_ERROR_H_
#define LOGVEC_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace logvec {
namespace core {

/**
 * @brief Base class for all logvec errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        TIMEOUT = 2,
        INTERNAL = 3,
        EMBEDDING_FAILED = 4,
        SOURCE_TERMINATED = 5,
        INDEX_CORRUPTION = 6
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }

private:
    Code code_;
};

class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

class TimeoutError : public Error {
public:
    explicit TimeoutError(const std::string& message)
        : Error(message, Code::TIMEOUT) {}
};

class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief The embedding collaborator could not produce vectors for a batch
 */
class EmbeddingError : public Error {
public:
    explicit EmbeddingError(const std::string& message)
        : Error(message, Code::EMBEDDING_FAILED) {}
};

/**
 * @brief The log line source ended and could not be restarted
 */
class SourceTerminatedError : public Error {
public:
    explicit SourceTerminatedError(const std::string& message)
        : Error(message, Code::SOURCE_TERMINATED) {}
};

/**
 * @brief Metadata and vector counts diverged, or the store outgrew its bound.
 *
 * Always a logic bug. Never caught and ignored.
 */
class IndexCorruptionError : public Error {
public:
    explicit IndexCorruptionError(const std::string& message)
        : Error(message, Code::INDEX_CORRUPTION) {}
};

const char* ErrorCodeName(Error::Code code);

} // namespace core
} // namespace logvec

#endif // LOGVEC_CORE_ERROR_H_
