#include <gtest/gtest.h>
#include <vector>

#include "logvec/core/error.h"
#include "logvec/index/ann_index.h"

using namespace logvec::index;
using namespace logvec::core;

TEST(FlatL2IndexTest, ZeroDimensionIsRejected) {
    EXPECT_THROW({ FlatL2Index index(0); }, InvalidArgumentError);
}

TEST(FlatL2IndexTest, SquaredDistance) {
    float a[] = {0.0f, 0.0f};
    float b[] = {3.0f, 4.0f};
    EXPECT_FLOAT_EQ(SquaredL2(a, b, 2), 25.0f);
}

TEST(FlatL2IndexTest, AssignsSequentialIds) {
    FlatL2Index index(2);
    ASSERT_TRUE(index.add({{0.0f, 0.0f}, {1.0f, 0.0f}}).ok());
    ASSERT_TRUE(index.add({{5.0f, 5.0f}}).ok());
    EXPECT_EQ(index.size(), 3u);

    auto hits = index.search({5.0f, 5.0f}, 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].id, 2);
    EXPECT_FLOAT_EQ(hits[0].distance, 0.0f);
}

TEST(FlatL2IndexTest, AddIsAllOrNothing) {
    FlatL2Index index(2);
    auto result = index.add({{1.0f, 1.0f}, {1.0f, 1.0f, 1.0f}});
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(index.size(), 0u);
}

TEST(FlatL2IndexTest, ResultsAscendingWithIdTieBreak) {
    FlatL2Index index(1);
    ASSERT_TRUE(index.add({{3.0f}, {1.0f}, {-1.0f}, {2.0f}, {1.0f}}).ok());

    auto hits = index.search({0.0f}, 4);
    ASSERT_EQ(hits.size(), 4u);
    EXPECT_EQ(hits[0].id, 1);
    EXPECT_EQ(hits[1].id, 2);
    EXPECT_EQ(hits[2].id, 4);
    EXPECT_EQ(hits[3].id, 3);
    for (size_t i = 1; i < hits.size(); ++i) {
        EXPECT_LE(hits[i - 1].distance, hits[i].distance);
    }
}

TEST(FlatL2IndexTest, KLargerThanSize) {
    FlatL2Index index(1);
    ASSERT_TRUE(index.add({{1.0f}, {2.0f}}).ok());
    EXPECT_EQ(index.search({0.0f}, 10).size(), 2u);
    EXPECT_TRUE(index.search({0.0f}, 0).empty());
    EXPECT_TRUE(index.search({0.0f, 0.0f}, 1).empty());
}

TEST(FlatL2IndexTest, Reset) {
    auto index = CreateFlatL2Index(1);
    ASSERT_TRUE(index->add({{1.0f}}).ok());
    index->reset();
    EXPECT_EQ(index->size(), 0u);
    EXPECT_TRUE(index->search({1.0f}, 1).empty());
    ASSERT_TRUE(index->add({{2.0f}}).ok());
    EXPECT_EQ(index->search({2.0f}, 1)[0].id, 0);
}
