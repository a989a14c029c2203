#include "logvec/pipeline/batch_embedder.h"

#include <exception>

#include "logvec/common/logger.h"

namespace logvec {
namespace pipeline {

BatchEmbedder::BatchEmbedder(const core::BatchConfig& config,
                             ingest::IngestChannel& channel,
                             embedding::Embedder& embedder,
                             index::VectorIndexStore& store)
    : config_(config), channel_(channel), embedder_(embedder), store_(store) {
}

BatchEmbedder::~BatchEmbedder() {
    join();
}

core::Result<void> BatchEmbedder::start() {
    if (running_.load() || worker_.joinable()) {
        return core::Result<void>::error("BatchEmbedder already started");
    }
    if (config_.batch_size == 0) {
        return core::Result<void>::error("Invalid batch size: 0", core::Error::Code::INVALID_ARGUMENT);
    }
    if (embedder_.dimension() != store_.dimension()) {
        return core::Result<void>::error(
            "Embedder dimension " + std::to_string(embedder_.dimension()) +
            " does not match store dimension " + std::to_string(store_.dimension()),
            core::Error::Code::INVALID_ARGUMENT);
    }
    running_.store(true);
    worker_ = std::thread(&BatchEmbedder::run, this);
    return core::Result<void>();
}

void BatchEmbedder::join() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

void BatchEmbedder::run() {
    std::vector<core::QueueItem> batch;
    batch.reserve(config_.batch_size);

    try {
        while (true) {
            auto item = channel_.pop(config_.dequeue_timeout);
            if (item) {
                batch.push_back(std::move(*item));
                if (batch.size() >= config_.batch_size) {
                    flush(batch);
                }
                continue;
            }

            // Timed out, or the channel is closed and empty.
            if (!batch.empty()) {
                stats_.partial_batches.fetch_add(1);
                flush(batch);
            }
            if (channel_.closed() && channel_.empty()) {
                break;
            }
        }
    } catch (const core::IndexCorruptionError& e) {
        LOGVEC_CRITICAL("Vector store corrupted, stopping ingestion: {}", e.what());
        if (fatal_handler_) {
            fatal_handler_(e);
        }
    }

    running_.store(false);
    LOGVEC_DEBUG("BatchEmbedder loop exited");
}

void BatchEmbedder::flush(std::vector<core::QueueItem>& batch) {
    auto result = process_batch(batch);
    if (!result.ok()) {
        // The batch is gone; later batches are unaffected.
        LOGVEC_ERROR("Dropped batch [{}]: {}", core::ErrorCodeName(result.code()), result.error());
    }
}

core::Result<void> BatchEmbedder::process_batch(std::vector<core::QueueItem>& batch) {
    if (batch.empty()) {
        return core::Result<void>();
    }

    std::vector<std::string> texts;
    texts.reserve(batch.size());
    for (const auto& item : batch) {
        texts.push_back(item.text);
    }

    auto embedded = [&]() -> core::Result<std::vector<core::Vector>> {
        try {
            return embedder_.embed(texts);
        } catch (const std::exception& e) {
            return core::Result<std::vector<core::Vector>>::error(
                e.what(), core::Error::Code::EMBEDDING_FAILED);
        }
    }();

    if (!embedded.ok()) {
        std::string reason = "embedding failed: " + embedded.error();
        fail_batch(batch, reason);
        return core::Result<void>::error(reason, core::Error::Code::EMBEDDING_FAILED);
    }

    std::vector<core::Vector> vectors = embedded.take_value();
    if (vectors.size() != batch.size()) {
        std::string reason = "embedder returned " + std::to_string(vectors.size()) +
                             " vectors for " + std::to_string(batch.size()) + " texts";
        fail_batch(batch, reason);
        return core::Result<void>::error(reason, core::Error::Code::EMBEDDING_FAILED);
    }

    std::vector<core::MetadataRecord> records;
    records.reserve(batch.size());
    for (auto& item : batch) {
        records.emplace_back(item.timestamp, std::move(item.text), item.kind);
    }

    auto appended = store_.append(vectors, std::move(records));
    if (!appended.ok()) {
        std::string reason = "store append failed: " + appended.error();
        fail_batch(batch, reason);
        return core::Result<void>::error(reason, appended.code());
    }

    stats_.batches_processed.fetch_add(1);
    stats_.items_indexed.fetch_add(vectors.size());
    LOGVEC_DEBUG("Indexed batch of {} items", vectors.size());
    batch.clear();
    return core::Result<void>();
}

void BatchEmbedder::fail_batch(std::vector<core::QueueItem>& batch, const std::string& reason) {
    LOGVEC_DEBUG("Batch of {} items failed: {}", batch.size(), reason);
    stats_.batches_failed.fetch_add(1);
    stats_.items_dropped.fetch_add(batch.size());
    batch.clear();
}

BatchEmbedderStatsSnapshot BatchEmbedder::stats() const {
    BatchEmbedderStatsSnapshot snap;
    snap.batches_processed = stats_.batches_processed.load();
    snap.batches_failed = stats_.batches_failed.load();
    snap.items_indexed = stats_.items_indexed.load();
    snap.items_dropped = stats_.items_dropped.load();
    snap.partial_batches = stats_.partial_batches.load();
    return snap;
}

} // namespace pipeline
} // namespace logvec
