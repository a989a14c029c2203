#include <gtest/gtest.h>
#include "logvec/core/error.h"
#include <string>

namespace logvec {
namespace core {
namespace {

TEST(ErrorTest, Construction) {
    Error error("Invalid input", Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(error.what(), std::string("Invalid input"));
}

TEST(ErrorTest, DefaultCodeIsUnknown) {
    Error error("something");
    EXPECT_EQ(error.code(), Error::Code::UNKNOWN);
}

TEST(ErrorTest, CopyConstruction) {
    Error original("Embedding backend down", Error::Code::EMBEDDING_FAILED);
    Error copy(original);

    EXPECT_EQ(copy.code(), original.code());
    EXPECT_STREQ(copy.what(), original.what());
}

TEST(ErrorTest, Subclasses) {
    EXPECT_EQ(InvalidArgumentError("x").code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(TimeoutError("x").code(), Error::Code::TIMEOUT);
    EXPECT_EQ(InternalError("x").code(), Error::Code::INTERNAL);
    EXPECT_EQ(EmbeddingError("x").code(), Error::Code::EMBEDDING_FAILED);
    EXPECT_EQ(SourceTerminatedError("x").code(), Error::Code::SOURCE_TERMINATED);
    EXPECT_EQ(IndexCorruptionError("x").code(), Error::Code::INDEX_CORRUPTION);
}

TEST(ErrorTest, CatchAsBase) {
    try {
        throw IndexCorruptionError("metadata and vectors diverged");
    } catch (const Error& e) {
        EXPECT_EQ(e.code(), Error::Code::INDEX_CORRUPTION);
        EXPECT_EQ(std::string(e.what()), "metadata and vectors diverged");
    }
}

TEST(ErrorTest, CodeNames) {
    EXPECT_STREQ(ErrorCodeName(Error::Code::UNKNOWN), "UNKNOWN");
    EXPECT_STREQ(ErrorCodeName(Error::Code::EMBEDDING_FAILED), "EMBEDDING_FAILED");
    EXPECT_STREQ(ErrorCodeName(Error::Code::SOURCE_TERMINATED), "SOURCE_TERMINATED");
    EXPECT_STREQ(ErrorCodeName(Error::Code::INDEX_CORRUPTION), "INDEX_CORRUPTION");
}

} // namespace
} // namespace core
} // namespace logvec
