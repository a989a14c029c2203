#ifndef LOGVEC_INDEX_VECTOR_INDEX_STORE_H_
#define LOGVEC_INDEX_VECTOR_INDEX_STORE_H_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>

#include "logvec/core/config.h"
#include "logvec/core/result.h"
#include "logvec/core/types.h"
#include "logvec/index/ann_index.h"

namespace logvec {
namespace index {

/**
 * @brief Hits of one search plus the store size observed under the same lock
 */
struct SearchResponse {
    std::vector<core::SearchHit> hits;
    size_t store_size = 0;
};

struct VectorIndexStoreStats {
    std::atomic<uint64_t> appends{0};
    std::atomic<uint64_t> vectors_appended{0};
    std::atomic<uint64_t> evicted{0};
    std::atomic<uint64_t> compactions{0};
    std::atomic<uint64_t> searches{0};
    std::atomic<uint64_t> stale_filtered{0};
};

struct VectorIndexStoreStatsSnapshot {
    uint64_t appends = 0;
    uint64_t vectors_appended = 0;
    uint64_t evicted = 0;
    uint64_t compactions = 0;
    uint64_t searches = 0;
    uint64_t stale_filtered = 0;
    size_t size = 0;
    size_t engine_size = 0;
};

/**
 * @brief Size-bounded metadata window and ANN engine kept in lockstep.
 *
 * Eviction uses logical offsets. Every appended entry gets the next logical
 * id; the live window is [base_id, next_id). The append-only engine keeps
 * evicted vectors, so search over-fetches by the number of stale vectors and
 * drops any hit whose logical id is below base_id. Once the engine holds
 * compaction_threshold stale vectors it is rebuilt from the live window,
 * which keeps engine memory bounded.
 *
 * One mutex guards append, search and compaction; the engine is never read
 * while it is being mutated.
 */
class VectorIndexStore {
public:
    explicit VectorIndexStore(const core::StoreConfig& config,
                              std::unique_ptr<AnnIndex> engine = nullptr);

    VectorIndexStore(const VectorIndexStore&) = delete;
    VectorIndexStore& operator=(const VectorIndexStore&) = delete;

    /**
     * @brief Append vectors and their records as one atomic step.
     *
     * Record ids are assigned here. Oldest entries beyond max_size are
     * evicted from both sides. Returns an error (store untouched) on length or
     * dimension mismatch; throws core::IndexCorruptionError if the size
     * invariant does not hold afterwards.
     */
    core::Result<void> append(const std::vector<core::Vector>& vectors,
                              std::vector<core::MetadataRecord> records);

    /**
     * @brief Nearest live entries, ascending by distance, at most min(k, size()).
     *
     * k <= 0 or an empty store yields no hits, not an error.
     */
    core::Result<SearchResponse> search(const core::Vector& query, int k) const;

    size_t size() const;
    size_t dimension() const { return config_.dimension; }
    size_t max_size() const { return config_.max_size; }

    // Logical id of the oldest live entry / of the next entry to be appended
    core::LogicalId base_id() const;
    core::LogicalId next_id() const;

    // Vectors currently held by the engine, stale ones included
    size_t engine_size() const;

    /**
     * @brief Drop every entry; logical ids keep increasing
     */
    void clear();

    VectorIndexStoreStatsSnapshot stats() const;

private:
    struct Slot {
        core::MetadataRecord record;
        core::Vector vector;
    };

    void evict_locked();
    void compact_locked();
    void check_invariants_locked() const;
    core::LogicalId base_id_locked() const { return next_id_ - window_.size(); }

    core::StoreConfig config_;
    std::unique_ptr<AnnIndex> engine_;

    mutable std::mutex mutex_;
    std::deque<Slot> window_;          // oldest first
    core::LogicalId next_id_ = 0;
    core::LogicalId engine_base_ = 0;  // logical id of engine id 0

    mutable VectorIndexStoreStats stats_;
};

} // namespace index
} // namespace logvec

#endif // LOGVEC_INDEX_VECTOR_INDEX_STORE_H_
