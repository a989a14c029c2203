#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "logvec/core/result.h"
#include "logvec/core/types.h"

namespace logvec {
namespace index {

struct AnnNeighbor {
    int64_t id = -1;  // engine-local, sequential from 0 in insertion order
    float distance = 0.0f;
};

/**
 * @brief Append-only nearest-neighbour engine.
 *
 * Not thread-safe: concurrent add() and search() need external locking.
 * Entries cannot be removed individually; reset() drops everything.
 */
class AnnIndex {
public:
    virtual ~AnnIndex() = default;

    /**
     * @brief Append vectors; they receive ids size() .. size()+n-1.
     *
     * All-or-nothing: on error the index is unchanged.
     */
    virtual core::Result<void> add(const std::vector<core::Vector>& vectors) = 0;

    /**
     * @brief Up to k neighbours, ascending by distance
     */
    virtual std::vector<AnnNeighbor> search(const core::Vector& query, size_t k) const = 0;

    virtual size_t size() const = 0;
    virtual size_t dimension() const = 0;
    virtual void reset() = 0;
};

/**
 * @brief Exact search over a contiguous float buffer, squared L2 distance.
 *
 * Ties are broken by the lower id so results are deterministic.
 */
class FlatL2Index : public AnnIndex {
public:
    explicit FlatL2Index(size_t dimension);

    core::Result<void> add(const std::vector<core::Vector>& vectors) override;
    std::vector<AnnNeighbor> search(const core::Vector& query, size_t k) const override;
    size_t size() const override { return count_; }
    size_t dimension() const override { return dimension_; }
    void reset() override;

private:
    size_t dimension_;
    size_t count_ = 0;
    std::vector<float> data_;
};

std::unique_ptr<AnnIndex> CreateFlatL2Index(size_t dimension);

float SquaredL2(const float* a, const float* b, size_t dimension);

} // namespace index
} // namespace logvec
