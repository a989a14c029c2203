#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include "logvec/core/config.h"
#include "logvec/core/error.h"
#include "logvec/core/result.h"
#include "logvec/core/types.h"
#include "logvec/embedding/embedder.h"
#include "logvec/index/vector_index_store.h"
#include "logvec/ingest/ingest_channel.h"

namespace logvec {
namespace pipeline {

struct BatchEmbedderStats {
    std::atomic<uint64_t> batches_processed{0};
    std::atomic<uint64_t> batches_failed{0};
    std::atomic<uint64_t> items_indexed{0};
    std::atomic<uint64_t> items_dropped{0};
    std::atomic<uint64_t> partial_batches{0};  // flushed by the dequeue timeout
};

struct BatchEmbedderStatsSnapshot {
    uint64_t batches_processed = 0;
    uint64_t batches_failed = 0;
    uint64_t items_indexed = 0;
    uint64_t items_dropped = 0;
    uint64_t partial_batches = 0;
};

/**
 * @brief Drains the ingest channel in batches, embeds them and appends the
 *        result to the vector store.
 *
 * A batch is closed when it reaches batch_size, or when a dequeue times out
 * with at least one item pending. A failed embedding drops that batch only.
 * After the channel is closed the loop drains what is left and exits.
 */
class BatchEmbedder {
public:
    using FatalHandler = std::function<void(const core::Error&)>;

    BatchEmbedder(const core::BatchConfig& config,
                  ingest::IngestChannel& channel,
                  embedding::Embedder& embedder,
                  index::VectorIndexStore& store);
    ~BatchEmbedder();

    BatchEmbedder(const BatchEmbedder&) = delete;
    BatchEmbedder& operator=(const BatchEmbedder&) = delete;

    core::Result<void> start();

    /**
     * @brief Join the worker. Returns once the channel is closed and drained,
     *        or after a fatal error.
     */
    void join();

    /**
     * @brief Embed and index one batch synchronously; clears it.
     *
     * An empty batch is a no-op: no embedder call, no store lock. Throws
     * core::IndexCorruptionError if the store reports a broken invariant.
     */
    core::Result<void> process_batch(std::vector<core::QueueItem>& batch);

    /**
     * @brief Called from the worker thread when the store is corrupted
     */
    void set_fatal_handler(FatalHandler handler) { fatal_handler_ = std::move(handler); }

    bool running() const { return running_.load(); }

    BatchEmbedderStatsSnapshot stats() const;

private:
    void run();
    void flush(std::vector<core::QueueItem>& batch);
    void fail_batch(std::vector<core::QueueItem>& batch, const std::string& reason);

    core::BatchConfig config_;
    ingest::IngestChannel& channel_;
    embedding::Embedder& embedder_;
    index::VectorIndexStore& store_;

    FatalHandler fatal_handler_;
    std::atomic<bool> running_{false};
    std::thread worker_;
    BatchEmbedderStats stats_;
};

} // namespace pipeline
} // namespace logvec
