#include <gtest/gtest.h>
#include "logvec/core/result.h"
#include <memory>
#include <string>
#include <vector>

namespace logvec {
namespace core {
namespace {

TEST(ResultTest, ValueConstruction) {
    Result<int> result(42);
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(result.code(), Error::Code::UNKNOWN);
}

TEST(ResultTest, ErrorConstruction) {
    auto result = Result<int>::error("embedding failed", Error::Code::EMBEDDING_FAILED);
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.error(), "embedding failed");
    EXPECT_EQ(result.code(), Error::Code::EMBEDDING_FAILED);
}

TEST(ResultTest, ErrorOnOkResultThrows) {
    Result<int> result(1);
    EXPECT_THROW(result.error(), std::runtime_error);
}

TEST(ResultTest, MoveOnlyPayload) {
    Result<std::unique_ptr<int>> result(std::make_unique<int>(7));
    ASSERT_TRUE(result.ok());
    auto ptr = result.take_value();
    ASSERT_NE(ptr, nullptr);
    EXPECT_EQ(*ptr, 7);
}

TEST(ResultTest, MoveConstruction) {
    Result<std::vector<float>> original(std::vector<float>{1.0f, 2.0f});
    Result<std::vector<float>> moved(std::move(original));
    ASSERT_TRUE(moved.ok());
    EXPECT_EQ(moved.value().size(), 2u);

    auto failed = Result<std::vector<float>>::error("bad", Error::Code::INTERNAL);
    Result<std::vector<float>> moved_error(std::move(failed));
    EXPECT_FALSE(moved_error.ok());
    EXPECT_EQ(moved_error.code(), Error::Code::INTERNAL);
}

TEST(ResultTest, MoveAssignment) {
    Result<std::string> a(std::string("a"));
    a = Result<std::string>::error("gone", Error::Code::TIMEOUT);
    EXPECT_FALSE(a.ok());
    EXPECT_EQ(a.error(), "gone");
}

TEST(ResultVoidTest, OkAndError) {
    Result<void> ok;
    EXPECT_TRUE(ok.ok());
    EXPECT_THROW(ok.error(), std::runtime_error);

    auto err = Result<void>::error("closed", Error::Code::SOURCE_TERMINATED);
    EXPECT_FALSE(err.ok());
    EXPECT_EQ(err.error(), "closed");
    EXPECT_EQ(err.code(), Error::Code::SOURCE_TERMINATED);
}

} // namespace
} // namespace core
} // namespace logvec
