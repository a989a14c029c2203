#include "logvec/query/query_engine.h"

#include <algorithm>
#include <cctype>
#include <exception>
#include <sstream>
#include <stdexcept>

#include <spdlog/fmt/fmt.h>

#include "logvec/common/logger.h"
#include "logvec/ingest/normalizer.h"

namespace logvec {
namespace query {

namespace {

const std::string kKeyK = "k=";
const std::string kKeyDisplay = "display=";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parse_positive_int(const std::string& text, int& out) {
    try {
        size_t pos = 0;
        int value = std::stoi(text, &pos);
        if (pos != text.size() || value <= 0) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

} // namespace

ParsedQuery parse_query(const std::string& input, const core::QueryConfig& config) {
    ParsedQuery parsed;
    parsed.options.k = config.default_k;
    parsed.options.display = config.default_display;

    std::vector<std::string> tokens;
    {
        std::istringstream in(input);
        std::string token;
        while (in >> token) {
            tokens.push_back(token);
        }
    }

    size_t text_end = tokens.size();
    while (text_end > 0) {
        const std::string& token = tokens[text_end - 1];
        if (starts_with(token, kKeyK)) {
            if (!parsed.k_given) {
                parsed.k_given = true;
                std::string value = token.substr(kKeyK.size());
                int k = 0;
                if (!parse_positive_int(value, k)) {
                    parsed.warnings.push_back("invalid k '" + value + "', must be a positive integer; using " +
                                              std::to_string(config.default_k));
                } else if (k > config.max_k) {
                    parsed.warnings.push_back("k " + value + " capped at " + std::to_string(config.max_k));
                    parsed.options.k = config.max_k;
                } else {
                    parsed.options.k = k;
                }
            }
        } else if (starts_with(token, kKeyDisplay)) {
            if (!parsed.display_given) {
                parsed.display_given = true;
                std::string value = to_lower(token.substr(kKeyDisplay.size()));
                if (value == "raw") {
                    parsed.options.display = core::DisplayMode::RAW;
                } else if (value == "pretty") {
                    parsed.options.display = core::DisplayMode::PRETTY;
                } else {
                    parsed.warnings.push_back("invalid display mode '" + value + "'; using " +
                                              core::DisplayModeName(config.default_display));
                }
            }
        } else {
            break;
        }
        --text_end;
    }

    for (size_t i = 0; i < text_end; ++i) {
        if (i > 0) parsed.text.push_back(' ');
        parsed.text += tokens[i];
    }
    return parsed;
}

bool is_exit_command(const std::string& line) {
    std::string word = to_lower(ingest::collapse_whitespace(line));
    return word == "exit" || word == "quit";
}

std::string format_hit(const core::SearchHit& hit, core::DisplayMode display) {
    if (display == core::DisplayMode::RAW) {
        return hit.record.text;
    }
    return fmt::format("{:.3f} | dist={:.3f} | {}",
                       static_cast<double>(hit.record.timestamp) / 1000.0,
                       hit.distance, hit.record.text);
}

QueryEngine::QueryEngine(const core::QueryConfig& config,
                         embedding::Embedder& embedder,
                         const index::VectorIndexStore& store)
    : config_(config), embedder_(embedder), store_(store) {
}

core::Result<QueryResponse> QueryEngine::handle(const std::string& input) const {
    queries_.fetch_add(1);

    QueryResponse response;
    response.query = parse_query(input, config_);
    for (const auto& warning : response.query.warnings) {
        LOGVEC_WARN("Query option: {}", warning);
    }

    // Reject before paying for an embedding.
    if (ingest::is_blank(response.query.text)) {
        rejected_empty_.fetch_add(1);
        return response;
    }

    auto embedded = [&]() -> core::Result<std::vector<core::Vector>> {
        try {
            return embedder_.embed({response.query.text});
        } catch (const std::exception& e) {
            return core::Result<std::vector<core::Vector>>::error(
                e.what(), core::Error::Code::EMBEDDING_FAILED);
        }
    }();
    if (!embedded.ok()) {
        return core::Result<QueryResponse>::error("query embedding failed: " + embedded.error(),
                                                  core::Error::Code::EMBEDDING_FAILED);
    }
    if (embedded.value().size() != 1) {
        return core::Result<QueryResponse>::error(
            "embedder returned " + std::to_string(embedded.value().size()) + " vectors for one query",
            core::Error::Code::EMBEDDING_FAILED);
    }

    auto searched = store_.search(embedded.value().front(), response.query.options.k);
    if (!searched.ok()) {
        return core::Result<QueryResponse>::error(searched.error(), searched.code());
    }
    index::SearchResponse found = searched.take_value();

    response.store_size = found.store_size;
    response.lines.reserve(found.hits.size());
    for (const auto& hit : found.hits) {
        response.lines.push_back(format_hit(hit, response.query.options.display));
    }
    LOGVEC_DEBUG("Query '{}' k={} -> {} hits from {} entries", response.query.text,
                 response.query.options.k, response.lines.size(), response.store_size);
    return response;
}

} // namespace query
} // namespace logvec
