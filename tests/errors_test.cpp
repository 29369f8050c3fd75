#include <gtest/gtest.h>
#include "liveline/common/errors.hpp"
#include <string>

using namespace liveline::common;

TEST(ErrorsTest, RegistryDescribesEveryCode) {
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::INVALID_ARGUMENT), "INVALID_ARGUMENT");
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::UNSUPPORTED_ENCODING), "UNSUPPORTED_ENCODING");
    EXPECT_STREQ(ErrorCodeHelper::toString(ErrorCode::RUNTIME_FAULT), "RUNTIME_FAULT");
    EXPECT_STREQ(ErrorCodeHelper::getMessage(ErrorCode::DEPRECATED), "Deprecated usage");
}

TEST(ErrorsTest, ThrowMacroRecordsLocation) {
    int line = 0;
    try {
        line = __LINE__ + 1;
        LIVELINE_THROW(InvalidArgument, "bad value {}", 42);
    } catch (const InvalidArgument& e) {
        EXPECT_STREQ(e.what(), "bad value 42");
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
        EXPECT_EQ(formatContext(e.where()), "errors_test.cpp:" + std::to_string(line));
        return;
    }
    FAIL() << "InvalidArgument was not thrown";
}

TEST(ErrorsTest, EmptyContextFormatsToNothing) {
    EXPECT_EQ(formatContext(SourceContext{}), "");
    DeprecationNotice notice("old call");
    EXPECT_TRUE(notice.where().empty());
    EXPECT_EQ(notice.code(), ErrorCode::DEPRECATED);
}
