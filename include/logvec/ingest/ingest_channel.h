#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "logvec/core/types.h"

namespace logvec {
namespace ingest {

struct IngestChannelStatsSnapshot {
    uint64_t pushed = 0;
    uint64_t popped = 0;
    uint64_t rejected = 0;        // pushes after close() or failed try_push
    uint64_t producer_waits = 0;  // pushes that blocked on a full channel
    size_t size = 0;
    size_t capacity = 0;
};

/**
 * @brief Bounded multi-producer / multi-consumer hand-off queue.
 *
 * A full channel blocks producers instead of dropping or growing, which
 * bounds memory regardless of the burst rate. Items are moved through;
 * each item has exactly one owner at a time.
 */
class IngestChannel {
public:
    explicit IngestChannel(size_t capacity);

    IngestChannel(const IngestChannel&) = delete;
    IngestChannel& operator=(const IngestChannel&) = delete;

    /**
     * @brief Blocking push.
     * @return false if the channel was closed before the item fit
     */
    bool push(core::QueueItem&& item);

    /**
     * @brief Non-blocking push.
     * @return false if the channel is full or closed
     */
    bool try_push(core::QueueItem&& item);

    /**
     * @brief Blocking pop with timeout.
     * @return std::nullopt on timeout, or once the channel is closed and empty
     */
    std::optional<core::QueueItem> pop(std::chrono::milliseconds timeout);

    /**
     * @brief Reject further pushes and wake all waiters.
     *
     * Items already queued can still be popped.
     */
    void close();

    bool closed() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    bool empty() const { return size() == 0; }

    IngestChannelStatsSnapshot stats() const;

private:
    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<core::QueueItem> items_;
    bool closed_ = false;

    std::atomic<uint64_t> pushed_{0};
    std::atomic<uint64_t> popped_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> producer_waits_{0};
};

} // namespace ingest
} // namespace logvec
