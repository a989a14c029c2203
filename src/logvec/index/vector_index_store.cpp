#include "logvec/index/vector_index_store.h"

#include <algorithm>

#include "logvec/common/logger.h"
#include "logvec/core/error.h"

namespace logvec {
namespace index {

VectorIndexStore::VectorIndexStore(const core::StoreConfig& config, std::unique_ptr<AnnIndex> engine)
    : config_(config), engine_(std::move(engine)) {
    if (config_.dimension == 0) {
        throw core::InvalidArgumentError("Store dimension must be positive");
    }
    if (config_.max_size == 0) {
        throw core::InvalidArgumentError("Store max_size must be positive");
    }
    if (!engine_) {
        engine_ = CreateFlatL2Index(config_.dimension);
    }
    if (engine_->dimension() != config_.dimension) {
        throw core::InvalidArgumentError("ANN engine dimension does not match store dimension");
    }
    if (engine_->size() != 0) {
        throw core::InvalidArgumentError("ANN engine must be empty");
    }
}

core::Result<void> VectorIndexStore::append(const std::vector<core::Vector>& vectors,
                                            std::vector<core::MetadataRecord> records) {
    if (vectors.size() != records.size()) {
        return core::Result<void>::error(
            "append: " + std::to_string(vectors.size()) + " vectors but " +
            std::to_string(records.size()) + " metadata records",
            core::Error::Code::INVALID_ARGUMENT);
    }
    if (vectors.empty()) {
        return core::Result<void>();
    }
    for (const auto& v : vectors) {
        if (v.size() != config_.dimension) {
            return core::Result<void>::error(
                "append: vector dimension " + std::to_string(v.size()) + " != " +
                std::to_string(config_.dimension), core::Error::Code::INVALID_ARGUMENT);
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto added = engine_->add(vectors);
    if (!added.ok()) {
        return added;
    }

    for (size_t i = 0; i < vectors.size(); ++i) {
        Slot slot;
        slot.record = std::move(records[i]);
        slot.record.id = next_id_++;
        slot.vector = vectors[i];
        window_.push_back(std::move(slot));
    }

    stats_.appends.fetch_add(1);
    stats_.vectors_appended.fetch_add(vectors.size());

    evict_locked();
    if (engine_->size() - window_.size() >= config_.effective_compaction_threshold()) {
        compact_locked();
    }
    check_invariants_locked();
    return core::Result<void>();
}

void VectorIndexStore::evict_locked() {
    size_t evicted = 0;
    while (window_.size() > config_.max_size) {
        window_.pop_front();
        evicted++;
    }
    if (evicted > 0) {
        stats_.evicted.fetch_add(evicted);
        LOGVEC_TRACE("Evicted {} oldest entries, live window starts at {}", evicted, base_id_locked());
    }
}

void VectorIndexStore::compact_locked() {
    std::vector<core::Vector> live;
    live.reserve(window_.size());
    for (const auto& slot : window_) {
        live.push_back(slot.vector);
    }

    size_t stale = engine_->size() - window_.size();
    engine_->reset();
    auto rebuilt = engine_->add(live);
    if (!rebuilt.ok()) {
        throw core::IndexCorruptionError("ANN rebuild failed: " + rebuilt.error());
    }
    engine_base_ = base_id_locked();
    stats_.compactions.fetch_add(1);
    LOGVEC_DEBUG("Compacted ANN engine: dropped {} stale vectors, {} live", stale, window_.size());
}

void VectorIndexStore::check_invariants_locked() const {
    const size_t live = window_.size();
    const size_t held = engine_->size();
    const core::LogicalId base = base_id_locked();

    if (live > config_.max_size) {
        throw core::IndexCorruptionError("store holds " + std::to_string(live) +
                                         " entries, bound is " + std::to_string(config_.max_size));
    }
    if (engine_base_ + held != next_id_ || engine_base_ > base) {
        throw core::IndexCorruptionError(
            "ANN engine out of step with metadata: engine holds " + std::to_string(held) +
            " vectors from logical id " + std::to_string(engine_base_) + ", metadata window is [" +
            std::to_string(base) + ", " + std::to_string(next_id_) + ")");
    }
    if (live > 0 && window_.front().record.id != base) {
        throw core::IndexCorruptionError("oldest metadata record has id " +
                                         std::to_string(window_.front().record.id) +
                                         ", expected " + std::to_string(base));
    }
}

core::Result<SearchResponse> VectorIndexStore::search(const core::Vector& query, int k) const {
    SearchResponse response;
    if (query.size() != config_.dimension) {
        return core::Result<SearchResponse>::error(
            "search: query dimension " + std::to_string(query.size()) + " != " +
            std::to_string(config_.dimension), core::Error::Code::INVALID_ARGUMENT);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    stats_.searches.fetch_add(1);
    response.store_size = window_.size();
    if (k <= 0 || response.store_size == 0) {
        return response;
    }

    const size_t want = std::min(static_cast<size_t>(k), response.store_size);
    const size_t held = engine_->size();
    const size_t stale = held - response.store_size;
    const core::LogicalId base = base_id_locked();

    auto neighbors = engine_->search(query, std::min(want + stale, held));
    response.hits.reserve(want);
    for (const auto& n : neighbors) {
        if (n.id < 0) {
            continue;
        }
        core::LogicalId logical = engine_base_ + static_cast<core::LogicalId>(n.id);
        if (logical < base) {
            stats_.stale_filtered.fetch_add(1);
            continue;
        }
        size_t offset = static_cast<size_t>(logical - base);
        if (offset >= window_.size()) {
            throw core::IndexCorruptionError("ANN engine returned logical id " +
                                             std::to_string(logical) + " beyond the metadata window");
        }
        core::SearchHit hit;
        hit.distance = n.distance;
        hit.record = window_[offset].record;
        response.hits.push_back(std::move(hit));
        if (response.hits.size() == want) {
            break;
        }
    }
    return response;
}

size_t VectorIndexStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return window_.size();
}

core::LogicalId VectorIndexStore::base_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_id_locked();
}

core::LogicalId VectorIndexStore::next_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_;
}

size_t VectorIndexStore::engine_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return engine_->size();
}

void VectorIndexStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.evicted.fetch_add(window_.size());
    window_.clear();
    engine_->reset();
    engine_base_ = next_id_;
    check_invariants_locked();
}

VectorIndexStoreStatsSnapshot VectorIndexStore::stats() const {
    VectorIndexStoreStatsSnapshot snap;
    snap.appends = stats_.appends.load();
    snap.vectors_appended = stats_.vectors_appended.load();
    snap.evicted = stats_.evicted.load();
    snap.compactions = stats_.compactions.load();
    snap.searches = stats_.searches.load();
    snap.stale_filtered = stats_.stale_filtered.load();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snap.size = window_.size();
        snap.engine_size = engine_->size();
    }
    return snap;
}

} // namespace index
} // namespace logvec
