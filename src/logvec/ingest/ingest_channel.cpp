#include "logvec/ingest/ingest_channel.h"

#include "logvec/core/error.h"

namespace logvec {
namespace ingest {

IngestChannel::IngestChannel(size_t capacity)
    : capacity_(capacity) {
    if (capacity_ == 0) {
        throw core::InvalidArgumentError("IngestChannel capacity must be positive");
    }
}

bool IngestChannel::push(core::QueueItem&& item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!closed_ && items_.size() >= capacity_) {
        producer_waits_.fetch_add(1);
        not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    }
    if (closed_) {
        rejected_.fetch_add(1);
        return false;
    }
    items_.push_back(std::move(item));
    pushed_.fetch_add(1);
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

bool IngestChannel::try_push(core::QueueItem&& item) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_ || items_.size() >= capacity_) {
        rejected_.fetch_add(1);
        return false;
    }
    items_.push_back(std::move(item));
    pushed_.fetch_add(1);
    lock.unlock();
    not_empty_.notify_one();
    return true;
}

std::optional<core::QueueItem> IngestChannel::pop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = not_empty_.wait_for(lock, timeout, [this] {
        return !items_.empty() || closed_;
    });
    if (!ready || items_.empty()) {
        return std::nullopt;
    }

    core::QueueItem item = std::move(items_.front());
    items_.pop_front();
    popped_.fetch_add(1);
    lock.unlock();
    not_full_.notify_one();
    return item;
}

void IngestChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

bool IngestChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t IngestChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

IngestChannelStatsSnapshot IngestChannel::stats() const {
    IngestChannelStatsSnapshot snap;
    snap.pushed = pushed_.load();
    snap.popped = popped_.load();
    snap.rejected = rejected_.load();
    snap.producer_waits = producer_waits_.load();
    snap.size = size();
    snap.capacity = capacity_;
    return snap;
}

} // namespace ingest
} // namespace logvec
