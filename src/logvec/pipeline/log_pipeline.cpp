#include "logvec/pipeline/log_pipeline.h"

#include "logvec/common/logger.h"
#include "logvec/core/error.h"

namespace logvec {
namespace pipeline {

LogPipeline::LogPipeline(const core::PipelineConfig& config,
                         std::unique_ptr<ingest::LineSource> source,
                         std::shared_ptr<embedding::Embedder> embedder,
                         std::unique_ptr<index::AnnIndex> engine)
    : config_(config), source_(std::move(source)), embedder_(std::move(embedder)) {
    auto valid = config_.validate();
    if (!valid.ok()) {
        throw core::InvalidArgumentError("Invalid pipeline configuration: " + valid.error());
    }
    if (!source_) {
        throw core::InvalidArgumentError("LogPipeline needs a line source");
    }
    if (!embedder_) {
        throw core::InvalidArgumentError("LogPipeline needs an embedder");
    }
    if (embedder_->dimension() != config_.store.dimension) {
        throw core::InvalidArgumentError(
            "Embedder '" + embedder_->name() + "' produces " + std::to_string(embedder_->dimension()) +
            "-dimensional vectors, store expects " + std::to_string(config_.store.dimension));
    }

    store_ = std::make_unique<index::VectorIndexStore>(config_.store, std::move(engine));
    cache_ = std::make_unique<ingest::RepeatCache>(config_.repeat_cache);
    channel_ = std::make_unique<ingest::IngestChannel>(config_.channel.capacity);
    flusher_ = std::make_unique<ingest::RepeatFlusher>(
        *cache_,
        [this](core::QueueItem&& item) { return channel_->push(std::move(item)); },
        config_.repeat_cache.flush_interval);
    batch_embedder_ = std::make_unique<BatchEmbedder>(config_.batch, *channel_, *embedder_, *store_);
    batch_embedder_->set_fatal_handler([this](const core::Error& error) { on_fatal(error); });
    query_engine_ = std::make_unique<query::QueryEngine>(config_.query, *embedder_, *store_);
}

LogPipeline::~LogPipeline() {
    auto result = shutdown();
    if (!result.ok()) {
        LOGVEC_ERROR("Pipeline shut down with error: {}", result.error());
    }
}

core::Result<void> LogPipeline::start() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (started_.load()) {
        return core::Result<void>::error("LogPipeline already started");
    }

    auto embedder_started = batch_embedder_->start();
    if (!embedder_started.ok()) {
        return embedder_started;
    }
    auto flusher_started = flusher_->start();
    if (!flusher_started.ok()) {
        channel_->close();
        batch_embedder_->join();
        return flusher_started;
    }
    reader_thread_ = std::thread(&LogPipeline::reader_loop, this);
    started_.store(true);

    LOGVEC_INFO("Pipeline started: source={}, embedder={} (dim {}), batch={}, flush every {} ms, max {} entries",
                source_->describe(), embedder_->name(), embedder_->dimension(),
                config_.batch.batch_size, config_.repeat_cache.flush_interval.count(),
                config_.store.max_size);
    return core::Result<void>();
}

core::Result<void> LogPipeline::shutdown() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (!started_.load() || shut_down_.load()) {
        return core::Result<void>();
    }

    LOGVEC_INFO("Shutting down pipeline");
    {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        stop_requested_.store(true);
    }
    state_cv_.notify_all();

    source_->stop();
    if (reader_thread_.joinable()) {
        reader_thread_.join();
    }

    // The embedder is still draining, so the final flush can make progress.
    flusher_->stop();

    channel_->close();
    batch_embedder_->join();

    shut_down_.store(true);
    log_stats();

    auto fatal = fatal_error();
    if (fatal) {
        return core::Result<void>::error(*fatal, core::Error::Code::INDEX_CORRUPTION);
    }
    return core::Result<void>();
}

bool LogPipeline::ingest_line(const core::RawLine& line) {
    auto observed = cache_->observe(line);
    switch (observed.outcome) {
        case ingest::Observation::FIRST_SEEN:
            if (!channel_->push(core::QueueItem(line.text, line.arrival, core::ItemKind::ORIGINAL))) {
                return false;
            }
            cache_->mark_forwarded(observed.fingerprint);
            return true;
        case ingest::Observation::UNTRACKED:
            return channel_->push(core::QueueItem(line.text, line.arrival, core::ItemKind::ORIGINAL));
        case ingest::Observation::SUPPRESSED:
        case ingest::Observation::IGNORED:
            return !channel_->closed();
    }
    return true;
}

void LogPipeline::reader_loop() {
    int restarts = 0;
    const int max_restarts = config_.source.max_restarts;

    while (!stop_requested_.load()) {
        auto started = source_->start();
        if (!started.ok()) {
            LOGVEC_ERROR("Failed to start log source {}: {}", source_->describe(), started.error());
        } else {
            // shutdown() may have stopped the source before it was (re)started.
            if (stop_requested_.load()) {
                break;
            }
            while (!stop_requested_.load()) {
                auto line = source_->read_line();
                if (!line) {
                    break;
                }
                lines_read_.fetch_add(1);
                if (!ingest_line(core::RawLine(std::move(*line), core::NowMillis()))) {
                    break;
                }
            }
        }

        if (stop_requested_.load()) {
            break;
        }

        // The source ended on its own: reap it before deciding what next.
        source_->stop();
        if (!source_->restartable()) {
            LOGVEC_INFO("Log source {} reached end of stream", source_->describe());
            source_exhausted_.store(true);
            notify_state_change();
            break;
        }
        if (restarts >= max_restarts) {
            LOGVEC_ERROR("Log source {} terminated; giving up after {} restarts",
                         source_->describe(), restarts);
            source_failed_.store(true);
            notify_state_change();
            break;
        }

        restarts++;
        source_restarts_.fetch_add(1);
        LOGVEC_WARN("Log source {} terminated unexpectedly, restarting ({}/{}) in {} ms",
                    source_->describe(), restarts, max_restarts, config_.source.restart_delay.count());
        std::unique_lock<std::mutex> lock(state_mutex_);
        state_cv_.wait_for(lock, config_.source.restart_delay,
                           [this] { return stop_requested_.load(); });
    }

    source_->stop();
    LOGVEC_DEBUG("Source reader exited");
}

core::Result<query::QueryResponse> LogPipeline::query(const std::string& text) const {
    return query_engine_->handle(text);
}

void LogPipeline::on_fatal(const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!fatal_error_) {
            fatal_error_ = error.what();
        }
        stop_requested_.store(true);
    }
    // Unblock producers waiting on a channel nobody drains any more.
    channel_->close();
    source_->stop();
    state_cv_.notify_all();
}

void LogPipeline::notify_state_change() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_cv_.notify_all();
}

bool LogPipeline::wait_for_stop(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] {
        return fatal_error_.has_value() || source_failed_.load() || source_exhausted_.load();
    });
}

std::optional<std::string> LogPipeline::fatal_error() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return fatal_error_;
}

PipelineStatsSnapshot LogPipeline::stats() const {
    PipelineStatsSnapshot snap;
    snap.lines_read = lines_read_.load();
    snap.source_restarts = source_restarts_.load();
    snap.cache = cache_->stats();
    snap.channel = channel_->stats();
    snap.batches = batch_embedder_->stats();
    snap.store = store_->stats();
    return snap;
}

void LogPipeline::log_stats() const {
    auto s = stats();
    LOGVEC_INFO("Lines read: {} (source restarts: {})", s.lines_read, s.source_restarts);
    LOGVEC_INFO("Repeat cache: {} first seen, {} suppressed, {} summaries, {} untracked",
                s.cache.first_seen, s.cache.suppressed, s.cache.summaries, s.cache.untracked);
    LOGVEC_INFO("Channel: {} pushed, {} popped, {} rejected, {} producer waits",
                s.channel.pushed, s.channel.popped, s.channel.rejected, s.channel.producer_waits);
    LOGVEC_INFO("Batches: {} indexed ({} items), {} failed ({} items dropped)",
                s.batches.batches_processed, s.batches.items_indexed,
                s.batches.batches_failed, s.batches.items_dropped);
    LOGVEC_INFO("Store: {} live entries, {} evicted, {} compactions, {} searches",
                s.store.size, s.store.evicted, s.store.compactions, s.store.searches);
}

} // namespace pipeline
} // namespace logvec
