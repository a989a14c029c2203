#ifndef LOGVEC_PIPELINE_LOG_PIPELINE_H_
#define LOGVEC_PIPELINE_LOG_PIPELINE_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "logvec/core/config.h"
#include "logvec/core/result.h"
#include "logvec/core/types.h"
#include "logvec/embedding/embedder.h"
#include "logvec/index/ann_index.h"
#include "logvec/index/vector_index_store.h"
#include "logvec/ingest/ingest_channel.h"
#include "logvec/ingest/line_source.h"
#include "logvec/ingest/repeat_cache.h"
#include "logvec/pipeline/batch_embedder.h"
#include "logvec/query/query_engine.h"

namespace logvec {
namespace pipeline {

struct PipelineStatsSnapshot {
    uint64_t lines_read = 0;
    uint64_t source_restarts = 0;
    ingest::RepeatCacheStatsSnapshot cache;
    ingest::IngestChannelStatsSnapshot channel;
    BatchEmbedderStatsSnapshot batches;
    index::VectorIndexStoreStatsSnapshot store;
};

/**
 * @brief Owns the whole ingest -> dedup -> batch -> index -> query pipeline.
 *
 * Everything is built in the constructor. start() launches the source
 * reader, the repeat flusher and the batch embedder; shutdown() stops them
 * in dependency order:
 *   1. stop the source (child signaled and reaped), join the reader
 *   2. final repeat flush, join the flusher
 *   3. close the channel, let the embedder drain it, join
 * query() can be called from any thread while the pipeline runs.
 */
class LogPipeline {
public:
    LogPipeline(const core::PipelineConfig& config,
                std::unique_ptr<ingest::LineSource> source,
                std::shared_ptr<embedding::Embedder> embedder,
                std::unique_ptr<index::AnnIndex> engine = nullptr);
    ~LogPipeline();

    LogPipeline(const LogPipeline&) = delete;
    LogPipeline& operator=(const LogPipeline&) = delete;

    core::Result<void> start();

    /**
     * @brief Stop every loop and wait for it. Idempotent.
     * @return error if the pipeline stopped because of a fatal condition
     */
    core::Result<void> shutdown();

    /**
     * @brief Deduplicate one raw line and forward it if it is new.
     *
     * Blocks while the ingest channel is full.
     * @return false once the channel is closed
     */
    bool ingest_line(const core::RawLine& line);

    core::Result<query::QueryResponse> query(const std::string& text) const;

    /**
     * @brief Wait until the pipeline stops on its own (fatal error, source
     *        failure or exhaustion) or the timeout expires.
     * @return true if it stopped on its own
     */
    bool wait_for_stop(std::chrono::milliseconds timeout) const;

    bool started() const { return started_.load(); }
    bool source_failed() const { return source_failed_.load(); }
    bool source_exhausted() const { return source_exhausted_.load(); }
    std::optional<std::string> fatal_error() const;

    const core::PipelineConfig& config() const { return config_; }
    const index::VectorIndexStore& store() const { return *store_; }
    ingest::RepeatCache& repeat_cache() { return *cache_; }
    ingest::RepeatFlusher& flusher() { return *flusher_; }

    PipelineStatsSnapshot stats() const;

private:
    void reader_loop();
    void on_fatal(const core::Error& error);
    void notify_state_change();
    void log_stats() const;

    core::PipelineConfig config_;
    std::unique_ptr<ingest::LineSource> source_;
    std::shared_ptr<embedding::Embedder> embedder_;

    std::unique_ptr<index::VectorIndexStore> store_;
    std::unique_ptr<ingest::RepeatCache> cache_;
    std::unique_ptr<ingest::IngestChannel> channel_;
    std::unique_ptr<ingest::RepeatFlusher> flusher_;
    std::unique_ptr<BatchEmbedder> batch_embedder_;
    std::unique_ptr<query::QueryEngine> query_engine_;

    std::thread reader_thread_;
    std::mutex lifecycle_mutex_;
    std::atomic<bool> started_{false};
    std::atomic<bool> shut_down_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> source_failed_{false};
    std::atomic<bool> source_exhausted_{false};

    mutable std::mutex state_mutex_;
    mutable std::condition_variable state_cv_;
    std::optional<std::string> fatal_error_;

    std::atomic<uint64_t> lines_read_{0};
    std::atomic<uint64_t> source_restarts_{0};
};

} // namespace pipeline
} // namespace logvec

#endif // LOGVEC_PIPELINE_LOG_PIPELINE_H_
