#include "logvec/core/types.h"

#include <chrono>

namespace logvec {
namespace core {

Timestamp NowMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

const char* ItemKindName(ItemKind kind) {
    switch (kind) {
        case ItemKind::ORIGINAL: return "original";
        case ItemKind::SUMMARY: return "summary";
    }
    return "unknown";
}

} // namespace core
} // namespace logvec
