#ifndef LOGVEC_QUERY_QUERY_ENGINE_H_
#define LOGVEC_QUERY_QUERY_ENGINE_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "logvec/core/config.h"
#include "logvec/core/result.h"
#include "logvec/core/types.h"
#include "logvec/embedding/embedder.h"
#include "logvec/index/vector_index_store.h"

namespace logvec {
namespace query {

struct QueryOptions {
    int k = 5;
    core::DisplayMode display = core::DisplayMode::PRETTY;
};

/**
 * @brief Query text with its trailing option tokens split off
 */
struct ParsedQuery {
    std::string text;  // what gets embedded
    QueryOptions options;
    bool k_given = false;
    bool display_given = false;
    std::vector<std::string> warnings;  // options that were present but invalid
};

/**
 * @brief Split trailing `k=<int>` / `display=<raw|pretty>` tokens off a query.
 *
 * Tokens are scanned from the end; scanning stops at the first token that is
 * not an option, so options in the middle of the text stay part of it. The
 * rightmost occurrence of an option wins. An option with an invalid value is
 * consumed, recorded in warnings and replaced by the configured default.
 */
ParsedQuery parse_query(const std::string& input, const core::QueryConfig& config);

/**
 * @brief "exit" or "quit", any case, surrounding whitespace ignored
 */
bool is_exit_command(const std::string& line);

std::string format_hit(const core::SearchHit& hit, core::DisplayMode display);

struct QueryResponse {
    ParsedQuery query;
    std::vector<std::string> lines;  // one formatted result per line
    size_t store_size = 0;           // read once, under the store lock

    bool empty() const { return lines.empty(); }
};

/**
 * @brief Parses, validates, embeds and runs similarity queries.
 *
 * Safe to call from several threads; the store serializes the search itself.
 */
class QueryEngine {
public:
    QueryEngine(const core::QueryConfig& config,
                embedding::Embedder& embedder,
                const index::VectorIndexStore& store);

    /**
     * @brief Run one query.
     *
     * Empty or whitespace-only text returns an empty response without calling
     * the embedder. Embedding or search failures return an error.
     */
    core::Result<QueryResponse> handle(const std::string& input) const;

    const core::QueryConfig& config() const { return config_; }

    uint64_t queries() const { return queries_.load(); }
    uint64_t rejected_empty() const { return rejected_empty_.load(); }

private:
    core::QueryConfig config_;
    embedding::Embedder& embedder_;
    const index::VectorIndexStore& store_;

    mutable std::atomic<uint64_t> queries_{0};
    mutable std::atomic<uint64_t> rejected_empty_{0};
};

} // namespace query
} // namespace logvec

#endif // LOGVEC_QUERY_QUERY_ENGINE_H_
