#ifndef LOGVEC_CORE_CONFIG_H_
#define LOGVEC_CORE_CONFIG_H_

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "logvec/core/result.h"

namespace logvec {
namespace core {

/**
 * @brief Configuration for the repeat cache and its flusher
 */
struct RepeatCacheConfig {
    std::chrono::milliseconds flush_interval{10000};  // 10 seconds
    size_t max_entries = 100000;                      // untracked beyond this

    static RepeatCacheConfig Default() { return RepeatCacheConfig{}; }
};

/**
 * @brief Configuration for the bounded ingest channel
 */
struct ChannelConfig {
    size_t capacity = 10000;

    static ChannelConfig Default() { return ChannelConfig{}; }
};

/**
 * @brief Configuration for the batching embedder loop
 */
struct BatchConfig {
    size_t batch_size = 16;
    std::chrono::milliseconds dequeue_timeout{2000};

    static BatchConfig Default() { return BatchConfig{}; }
};

/**
 * @brief Configuration for the bounded vector store
 */
struct StoreConfig {
    size_t dimension = 384;
    size_t max_size = 100000;
    // Stale vectors the ANN engine may hold before it is rebuilt from the
    // live window. 0 means "same as max_size".
    size_t compaction_threshold = 0;

    size_t effective_compaction_threshold() const {
        return compaction_threshold == 0 ? max_size : compaction_threshold;
    }

    static StoreConfig Default() { return StoreConfig{}; }
};

enum class DisplayMode {
    PRETTY,  // "<timestamp> | dist=<d> | <text>"
    RAW      // text only
};

const char* DisplayModeName(DisplayMode mode);

/**
 * @brief Defaults applied when a query carries no option tokens
 */
struct QueryConfig {
    int default_k = 5;
    int max_k = 1000;
    DisplayMode default_display = DisplayMode::PRETTY;

    static QueryConfig Default() { return QueryConfig{}; }
};

/**
 * @brief Configuration for the log line source and its restart policy
 */
struct SourceConfig {
    std::vector<std::string> command{"journalctl", "-f", "-o", "short"};
    std::string replay_file;  // when set, lines are read from this file instead
    int max_restarts = 3;
    std::chrono::milliseconds restart_delay{1000};
    std::chrono::milliseconds stop_grace{5000};  // SIGTERM -> SIGKILL

    static SourceConfig Default() { return SourceConfig{}; }
};

/**
 * @brief Top-level pipeline configuration
 */
struct PipelineConfig {
    RepeatCacheConfig repeat_cache;
    ChannelConfig channel;
    BatchConfig batch;
    StoreConfig store;
    QueryConfig query;
    SourceConfig source;

    static PipelineConfig Default() { return PipelineConfig{}; }

    /**
     * @brief Reject values the pipeline cannot run with
     */
    Result<void> validate() const;
};

} // namespace core
} // namespace logvec

#endif // LOGVEC_CORE_CONFIG_H_
