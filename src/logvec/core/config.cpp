#include "logvec/core/config.h"

namespace logvec {
namespace core {

const char* DisplayModeName(DisplayMode mode) {
    switch (mode) {
        case DisplayMode::PRETTY: return "pretty";
        case DisplayMode::RAW: return "raw";
    }
    return "pretty";
}

Result<void> PipelineConfig::validate() const {
    const auto invalid = Error::Code::INVALID_ARGUMENT;
    if (repeat_cache.flush_interval.count() <= 0) {
        return Result<void>::error("flush interval must be positive", invalid);
    }
    if (repeat_cache.max_entries == 0) {
        return Result<void>::error("repeat cache max_entries must be positive", invalid);
    }
    if (channel.capacity == 0) {
        return Result<void>::error("channel capacity must be positive", invalid);
    }
    if (batch.batch_size == 0) {
        return Result<void>::error("batch size must be positive", invalid);
    }
    if (batch.dequeue_timeout.count() <= 0) {
        return Result<void>::error("dequeue timeout must be positive", invalid);
    }
    if (store.dimension == 0) {
        return Result<void>::error("vector dimension must be positive", invalid);
    }
    if (store.max_size == 0) {
        return Result<void>::error("store max_size must be positive", invalid);
    }
    if (query.default_k <= 0) {
        return Result<void>::error("default k must be positive", invalid);
    }
    if (query.max_k < query.default_k) {
        return Result<void>::error("max k must not be smaller than default k", invalid);
    }
    if (source.replay_file.empty() && source.command.empty()) {
        return Result<void>::error("no log source configured", invalid);
    }
    if (source.max_restarts < 0) {
        return Result<void>::error("max_restarts must not be negative", invalid);
    }
    return Result<void>();
}

} // namespace core
} // namespace logvec
