#ifndef LOGVEC_CORE_TYPES_H_
#define LOGVEC_CORE_TYPES_H_

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace logvec {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

/**
 * @brief Fixed-dimension embedding vector
 */
using Vector = std::vector<float>;

/**
 * @brief Monotonically increasing position of an entry in the store
 */
using LogicalId = uint64_t;

/**
 * @brief Wall-clock time in milliseconds since Unix epoch
 */
Timestamp NowMillis();

/**
 * @brief A line exactly as the source produced it
 */
struct RawLine {
    std::string text;
    Timestamp arrival = 0;

    RawLine() = default;
    RawLine(std::string t, Timestamp ts) : text(std::move(t)), arrival(ts) {}
};

enum class ItemKind : uint8_t {
    ORIGINAL,  // first occurrence of a fingerprint, forwarded as-is
    SUMMARY    // synthesized "repeated Nx" line
};

const char* ItemKindName(ItemKind kind);

/**
 * @brief Unit of work travelling through the ingest channel
 */
struct QueueItem {
    std::string text;
    Timestamp timestamp = 0;
    ItemKind kind = ItemKind::ORIGINAL;

    QueueItem() = default;
    QueueItem(std::string t, Timestamp ts, ItemKind k = ItemKind::ORIGINAL)
        : text(std::move(t)), timestamp(ts), kind(k) {}
};

/**
 * @brief Display data stored next to each indexed vector
 */
struct MetadataRecord {
    LogicalId id = 0;  // assigned by the store on append
    Timestamp timestamp = 0;
    std::string text;
    ItemKind kind = ItemKind::ORIGINAL;

    MetadataRecord() = default;
    MetadataRecord(Timestamp ts, std::string t, ItemKind k = ItemKind::ORIGINAL)
        : timestamp(ts), text(std::move(t)), kind(k) {}
};

/**
 * @brief One nearest-neighbour result
 */
struct SearchHit {
    float distance = 0.0f;
    MetadataRecord record;
};

} // namespace core
} // namespace logvec

#endif // LOGVEC_CORE_TYPES_H_
