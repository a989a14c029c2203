#include "logvec/core/error.h"

namespace logvec {
namespace core {

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::EMBEDDING_FAILED: return "EMBEDDING_FAILED";
        case Error::Code::SOURCE_TERMINATED: return "SOURCE_TERMINATED";
        case Error::Code::INDEX_CORRUPTION: return "INDEX_CORRUPTION";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace logvec
