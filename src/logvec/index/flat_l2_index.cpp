#include "logvec/index/ann_index.h"

#include <algorithm>

#include "logvec/core/error.h"

namespace logvec {
namespace index {

float SquaredL2(const float* a, const float* b, size_t dimension) {
    float sum = 0.0f;
    for (size_t i = 0; i < dimension; ++i) {
        float d = a[i] - b[i];
        sum += d * d;
    }
    return sum;
}

FlatL2Index::FlatL2Index(size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw core::InvalidArgumentError("FlatL2Index dimension must be positive");
    }
}

core::Result<void> FlatL2Index::add(const std::vector<core::Vector>& vectors) {
    for (const auto& v : vectors) {
        if (v.size() != dimension_) {
            return core::Result<void>::error(
                "Vector dimension " + std::to_string(v.size()) + " != index dimension " +
                std::to_string(dimension_), core::Error::Code::INVALID_ARGUMENT);
        }
    }
    data_.reserve(data_.size() + vectors.size() * dimension_);
    for (const auto& v : vectors) {
        data_.insert(data_.end(), v.begin(), v.end());
    }
    count_ += vectors.size();
    return core::Result<void>();
}

std::vector<AnnNeighbor> FlatL2Index::search(const core::Vector& query, size_t k) const {
    std::vector<AnnNeighbor> out;
    if (k == 0 || count_ == 0 || query.size() != dimension_) {
        return out;
    }

    out.reserve(count_);
    for (size_t i = 0; i < count_; ++i) {
        AnnNeighbor n;
        n.id = static_cast<int64_t>(i);
        n.distance = SquaredL2(query.data(), data_.data() + i * dimension_, dimension_);
        out.push_back(n);
    }

    size_t top = std::min(k, out.size());
    std::partial_sort(out.begin(), out.begin() + top, out.end(),
                      [](const AnnNeighbor& a, const AnnNeighbor& b) {
                          if (a.distance != b.distance) return a.distance < b.distance;
                          return a.id < b.id;
                      });
    out.resize(top);
    return out;
}

void FlatL2Index::reset() {
    data_.clear();
    data_.shrink_to_fit();
    count_ = 0;
}

std::unique_ptr<AnnIndex> CreateFlatL2Index(size_t dimension) {
    return std::make_unique<FlatL2Index>(dimension);
}

} // namespace index
} // namespace logvec
