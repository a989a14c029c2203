#include "logvec/ingest/repeat_cache.h"

#include <algorithm>
#include <ctime>

#include <spdlog/fmt/fmt.h>

#include "logvec/common/logger.h"
#include "logvec/ingest/normalizer.h"

namespace logvec {
namespace ingest {

RepeatCache::RepeatCache(const core::RepeatCacheConfig& config)
    : config_(config) {
}

ObserveResult RepeatCache::observe(const core::RawLine& line) {
    ObserveResult result;
    result.fingerprint = normalize(line.text);
    if (result.fingerprint.empty()) {
        result.outcome = Observation::IGNORED;
        return result;
    }
    stats_.lines_observed.fetch_add(1);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(result.fingerprint);
        if (it != entries_.end()) {
            it->second.count++;
            it->second.last_seen = line.arrival;
            result.outcome = Observation::SUPPRESSED;
        } else if (entries_.size() >= config_.max_entries) {
            result.outcome = Observation::UNTRACKED;
        } else {
            RepeatEntry entry;
            entry.fingerprint = result.fingerprint;
            entry.representative = line.text;
            entry.count = 1;
            entry.first_seen = line.arrival;
            entry.last_seen = line.arrival;
            entries_.emplace(result.fingerprint, std::move(entry));
            entry_count_.store(entries_.size(), std::memory_order_release);
            result.outcome = Observation::FIRST_SEEN;
        }
    }

    switch (result.outcome) {
        case Observation::SUPPRESSED: stats_.suppressed.fetch_add(1); break;
        case Observation::UNTRACKED: stats_.untracked.fetch_add(1); break;
        case Observation::FIRST_SEEN: stats_.first_seen.fetch_add(1); break;
        case Observation::IGNORED: break;
    }
    return result;
}

void RepeatCache::mark_forwarded(const std::string& fingerprint) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(fingerprint);
    if (it != entries_.end()) {
        it->second.forwarded = true;
    }
}

std::vector<RepeatEntry> RepeatCache::drain() {
    std::vector<RepeatEntry> repeated;
    uint64_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = entries_.begin(); it != entries_.end();) {
            if (!it->second.forwarded) {
                ++it;
                continue;
            }
            if (it->second.count > 1) {
                repeated.push_back(std::move(it->second));
            } else {
                dropped++;
            }
            it = entries_.erase(it);
        }
        entry_count_.store(entries_.size(), std::memory_order_release);
    }

    stats_.drains.fetch_add(1);
    stats_.singles_dropped.fetch_add(dropped);
    stats_.summaries.fetch_add(repeated.size());

    std::sort(repeated.begin(), repeated.end(),
              [](const RepeatEntry& a, const RepeatEntry& b) { return a.first_seen < b.first_seen; });
    return repeated;
}

RepeatCacheStatsSnapshot RepeatCache::stats() const {
    RepeatCacheStatsSnapshot snap;
    snap.lines_observed = stats_.lines_observed.load();
    snap.first_seen = stats_.first_seen.load();
    snap.suppressed = stats_.suppressed.load();
    snap.untracked = stats_.untracked.load();
    snap.drains = stats_.drains.load();
    snap.summaries = stats_.summaries.load();
    snap.singles_dropped = stats_.singles_dropped.load();
    return snap;
}

std::string format_flush_time(core::Timestamp ts) {
    std::time_t seconds = static_cast<std::time_t>(ts / 1000);
    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf, n);
}

std::string format_repeat_summary(const std::string& flush_time, const RepeatEntry& entry) {
    return fmt::format("{} | '{}' repeated {}x", flush_time, entry.representative, entry.count);
}

// ============================================================================
// RepeatFlusher
// ============================================================================

RepeatFlusher::RepeatFlusher(RepeatCache& cache, Sink sink, std::chrono::milliseconds interval,
                             Clock clock)
    : cache_(cache), sink_(std::move(sink)), interval_(interval), clock_(std::move(clock)) {
}

RepeatFlusher::~RepeatFlusher() {
    stop();
}

core::Result<void> RepeatFlusher::start() {
    if (running_.load()) {
        return core::Result<void>::error("RepeatFlusher already running");
    }
    if (interval_.count() <= 0) {
        return core::Result<void>::error("Invalid flush interval",
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&RepeatFlusher::run, this);
    return core::Result<void>();
}

void RepeatFlusher::stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);
}

size_t RepeatFlusher::flush_once() {
    ticks_.fetch_add(1);
    if (cache_.empty()) {
        return 0;
    }

    auto repeated = cache_.drain();
    if (repeated.empty()) {
        return 0;
    }

    // One timestamp per tick, shared by every summary it emits.
    const core::Timestamp now = clock_();
    const std::string flush_time = format_flush_time(now);

    size_t forwarded = 0;
    for (const auto& entry : repeated) {
        core::QueueItem item(format_repeat_summary(flush_time, entry), now, core::ItemKind::SUMMARY);
        if (!sink_(std::move(item))) {
            LOGVEC_WARN("Ingest channel closed, dropping {} repeat summaries",
                        repeated.size() - forwarded);
            break;
        }
        forwarded++;
    }
    LOGVEC_DEBUG("Flushed {} repeat summaries", forwarded);
    return forwarded;
}

void RepeatFlusher::run() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            if (wake_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
                break;
            }
        }
        flush_once();
    }

    // Final flush so the last window's repeats are not lost.
    flush_once();
}

} // namespace ingest
} // namespace logvec
