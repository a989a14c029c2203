#include <gtest/gtest.h>
#include "logvec/core/config.h"
#include <string>

namespace logvec {
namespace core {
namespace {

TEST(PipelineConfigTest, Defaults) {
    auto config = PipelineConfig::Default();
    EXPECT_EQ(config.repeat_cache.flush_interval, std::chrono::milliseconds(10000));
    EXPECT_EQ(config.channel.capacity, 10000u);
    EXPECT_EQ(config.batch.batch_size, 16u);
    EXPECT_EQ(config.batch.dequeue_timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.store.dimension, 384u);
    EXPECT_EQ(config.store.max_size, 100000u);
    EXPECT_EQ(config.query.default_k, 5);
    EXPECT_EQ(config.query.default_display, DisplayMode::PRETTY);
    ASSERT_EQ(config.source.command.size(), 4u);
    EXPECT_EQ(config.source.command[0], "journalctl");
    EXPECT_EQ(config.source.max_restarts, 3);
    EXPECT_TRUE(config.validate().ok());
}

TEST(PipelineConfigTest, CompactionThresholdFallsBackToMaxSize) {
    StoreConfig store;
    store.max_size = 50;
    EXPECT_EQ(store.effective_compaction_threshold(), 50u);
    store.compaction_threshold = 8;
    EXPECT_EQ(store.effective_compaction_threshold(), 8u);
}

TEST(PipelineConfigTest, RejectsZeroValues) {
    {
        auto config = PipelineConfig::Default();
        config.batch.batch_size = 0;
        auto result = config.validate();
        EXPECT_FALSE(result.ok());
        EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
    }
    {
        auto config = PipelineConfig::Default();
        config.store.max_size = 0;
        EXPECT_FALSE(config.validate().ok());
    }
    {
        auto config = PipelineConfig::Default();
        config.store.dimension = 0;
        EXPECT_FALSE(config.validate().ok());
    }
    {
        auto config = PipelineConfig::Default();
        config.channel.capacity = 0;
        EXPECT_FALSE(config.validate().ok());
    }
    {
        auto config = PipelineConfig::Default();
        config.repeat_cache.flush_interval = std::chrono::milliseconds(0);
        EXPECT_FALSE(config.validate().ok());
    }
}

TEST(PipelineConfigTest, RejectsInconsistentQueryLimits) {
    auto config = PipelineConfig::Default();
    config.query.default_k = 10;
    config.query.max_k = 3;
    EXPECT_FALSE(config.validate().ok());
}

TEST(PipelineConfigTest, RequiresSomeSource) {
    auto config = PipelineConfig::Default();
    config.source.command.clear();
    EXPECT_FALSE(config.validate().ok());
    config.source.replay_file = "/var/log/syslog";
    EXPECT_TRUE(config.validate().ok());
}

TEST(DisplayModeTest, Names) {
    EXPECT_STREQ(DisplayModeName(DisplayMode::PRETTY), "pretty");
    EXPECT_STREQ(DisplayModeName(DisplayMode::RAW), "raw");
}

} // namespace
} // namespace core
} // namespace logvec
