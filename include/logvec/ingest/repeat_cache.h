#ifndef LOGVEC_INGEST_REPEAT_CACHE_H_
#define LOGVEC_INGEST_REPEAT_CACHE_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "logvec/core/config.h"
#include "logvec/core/result.h"
#include "logvec/core/types.h"

namespace logvec {
namespace ingest {

/**
 * @brief Repeat counter for one fingerprint within the current flush window
 */
struct RepeatEntry {
    std::string fingerprint;
    std::string representative;  // first raw line seen for this fingerprint
    uint64_t count = 0;          // occurrences in the window, first one included
    core::Timestamp first_seen = 0;
    core::Timestamp last_seen = 0;
    bool forwarded = false;      // first occurrence has reached the channel
};

enum class Observation {
    FIRST_SEEN,  // caller must forward the raw line, then mark_forwarded()
    SUPPRESSED,  // repeat, counted only
    UNTRACKED,   // cache full; caller forwards the line without tracking it
    IGNORED      // blank line
};

struct ObserveResult {
    Observation outcome = Observation::IGNORED;
    std::string fingerprint;
};

struct RepeatCacheStats {
    std::atomic<uint64_t> lines_observed{0};
    std::atomic<uint64_t> first_seen{0};
    std::atomic<uint64_t> suppressed{0};
    std::atomic<uint64_t> untracked{0};
    std::atomic<uint64_t> drains{0};
    std::atomic<uint64_t> summaries{0};
    std::atomic<uint64_t> singles_dropped{0};
};

struct RepeatCacheStatsSnapshot {
    uint64_t lines_observed = 0;
    uint64_t first_seen = 0;
    uint64_t suppressed = 0;
    uint64_t untracked = 0;
    uint64_t drains = 0;
    uint64_t summaries = 0;
    uint64_t singles_dropped = 0;
};

/**
 * @brief Per-fingerprint repeat counters guarded by one short-held mutex.
 *
 * Only map mutation happens under the lock; normalization runs before it and
 * summary formatting after it.
 */
class RepeatCache {
public:
    explicit RepeatCache(const core::RepeatCacheConfig& config = core::RepeatCacheConfig::Default());

    RepeatCache(const RepeatCache&) = delete;
    RepeatCache& operator=(const RepeatCache&) = delete;

    ObserveResult observe(const core::RawLine& line);

    /**
     * @brief Record that the first occurrence of fingerprint is in the channel.
     *
     * Until then drain() keeps the entry, so a summary can never overtake
     * the line it summarizes.
     */
    void mark_forwarded(const std::string& fingerprint);

    /**
     * @brief Snapshot-and-clear.
     * @return forwarded entries with count > 1, ordered by first_seen.
     *         Forwarded single occurrences are dropped, unforwarded entries
     *         stay in the cache.
     */
    std::vector<RepeatEntry> drain();

    // Lock-free check used by the flusher to skip idle ticks
    bool empty() const { return entry_count_.load(std::memory_order_acquire) == 0; }
    size_t size() const { return entry_count_.load(std::memory_order_acquire); }

    RepeatCacheStatsSnapshot stats() const;

private:
    core::RepeatCacheConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RepeatEntry> entries_;
    std::atomic<size_t> entry_count_{0};
    RepeatCacheStats stats_;
};

/**
 * @brief Local wall-clock time as "%Y-%m-%d %H:%M:%S"
 */
std::string format_flush_time(core::Timestamp ts);

/**
 * @brief "<flush-time> | '<representative>' repeated <count>x"
 */
std::string format_repeat_summary(const std::string& flush_time, const RepeatEntry& entry);

/**
 * @brief Periodically drains a RepeatCache into summary lines.
 *
 * Runs its own thread. stop() wakes it immediately, performs one final
 * flush and joins.
 */
class RepeatFlusher {
public:
    // Returns false when the downstream channel no longer accepts items.
    using Sink = std::function<bool(core::QueueItem&&)>;
    using Clock = std::function<core::Timestamp()>;

    RepeatFlusher(RepeatCache& cache, Sink sink, std::chrono::milliseconds interval,
                  Clock clock = core::NowMillis);
    ~RepeatFlusher();

    RepeatFlusher(const RepeatFlusher&) = delete;
    RepeatFlusher& operator=(const RepeatFlusher&) = delete;

    core::Result<void> start();
    void stop();

    /**
     * @brief Run one flush tick synchronously.
     * @return number of summaries handed to the sink
     */
    size_t flush_once();

    uint64_t ticks() const { return ticks_.load(); }

private:
    void run();

    RepeatCache& cache_;
    Sink sink_;
    std::chrono::milliseconds interval_;
    Clock clock_;

    std::mutex wait_mutex_;
    std::condition_variable wake_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::thread thread_;
};

} // namespace ingest
} // namespace logvec

#endif // LOGVEC_INGEST_REPEAT_CACHE_H_
