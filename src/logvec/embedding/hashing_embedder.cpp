#include "logvec/embedding/embedder.h"

#include <cctype>
#include <cmath>
#include <cstdint>

#include "logvec/core/error.h"

namespace logvec {
namespace embedding {

namespace {

constexpr float kTokenWeight = 1.0f;
constexpr float kTrigramWeight = 0.5f;

uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || c == '_' || c == '.' || c == '-') {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

} // namespace

HashingEmbedder::HashingEmbedder(size_t dimension)
    : dimension_(dimension) {
    if (dimension_ == 0) {
        throw core::InvalidArgumentError("Embedding dimension must be positive");
    }
}

void HashingEmbedder::add_feature(core::Vector& vec, const std::string& feature, float weight) const {
    uint64_t h = fnv1a(feature);
    size_t slot = static_cast<size_t>(h % dimension_);
    float sign = (h >> 63) ? -1.0f : 1.0f;
    vec[slot] += sign * weight;
}

core::Vector HashingEmbedder::embed_one(const std::string& text) const {
    core::Vector vec(dimension_, 0.0f);
    for (const auto& token : tokenize(text)) {
        add_feature(vec, token, kTokenWeight);
        if (token.size() > 3) {
            std::string padded = "#" + token + "#";
            for (size_t i = 0; i + 3 <= padded.size(); ++i) {
                add_feature(vec, padded.substr(i, 3), kTrigramWeight);
            }
        }
    }

    double norm = 0.0;
    for (float v : vec) {
        norm += static_cast<double>(v) * v;
    }
    if (norm > 0.0) {
        float inv = static_cast<float>(1.0 / std::sqrt(norm));
        for (auto& v : vec) {
            v *= inv;
        }
    }
    return vec;
}

core::Result<std::vector<core::Vector>> HashingEmbedder::embed(const std::vector<std::string>& texts) {
    std::vector<core::Vector> out;
    out.reserve(texts.size());
    for (const auto& text : texts) {
        out.push_back(embed_one(text));
    }
    return out;
}

std::unique_ptr<Embedder> CreateHashingEmbedder(size_t dimension) {
    return std::make_unique<HashingEmbedder>(dimension);
}

} // namespace embedding
} // namespace logvec
