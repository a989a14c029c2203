#ifndef LOGVEC_EMBEDDING_EMBEDDER_H_
#define LOGVEC_EMBEDDING_EMBEDDER_H_

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "logvec/core/result.h"
#include "logvec/core/types.h"

namespace logvec {
namespace embedding {

/**
 * @brief Maps text to fixed-dimension vectors.
 *
 * embed() is called from the batch embedder thread and from query callers at
 * the same time, so implementations must be thread-safe. Output order matches
 * input order and identical input yields identical vectors.
 */
class Embedder {
public:
    virtual ~Embedder() = default;

    virtual core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) = 0;

    virtual size_t dimension() const = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Signed feature hashing over word tokens and character trigrams.
 *
 * No model files, no network: a lexical stand-in for a sentence embedding
 * model. Vectors are L2-normalized; text without tokens maps to the zero
 * vector.
 */
class HashingEmbedder : public Embedder {
public:
    explicit HashingEmbedder(size_t dimension);

    core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) override;
    size_t dimension() const override { return dimension_; }
    std::string name() const override { return "hashing"; }

    core::Vector embed_one(const std::string& text) const;

private:
    void add_feature(core::Vector& vec, const std::string& feature, float weight) const;

    size_t dimension_;
};

std::unique_ptr<Embedder> CreateHashingEmbedder(size_t dimension);

} // namespace embedding
} // namespace logvec

#endif // LOGVEC_EMBEDDING_EMBEDDER_H_
