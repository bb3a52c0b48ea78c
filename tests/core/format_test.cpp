#include "cloudup/core/format.hpp"

#include <gtest/gtest.h>

using cloudup::base64_encode;
using cloudup::format_size;

TEST(FormatSizeTest, UsesBinaryUnitsWithTwoDecimals) {
    EXPECT_EQ(format_size(0), "0.00 B");
    EXPECT_EQ(format_size(512), "512.00 B");
    EXPECT_EQ(format_size(1024), "1.00 KB");
    EXPECT_EQ(format_size(2 * 1024 * 1024), "2.00 MB");
    EXPECT_EQ(format_size(250ULL * 1024 * 1024 * 1024), "250.00 GB");
}

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(base64_encode(""), "");
    EXPECT_EQ(base64_encode("f"), "Zg==");
    EXPECT_EQ(base64_encode("fo"), "Zm8=");
    EXPECT_EQ(base64_encode("foo"), "Zm9v");
    EXPECT_EQ(base64_encode("user:pass"), "dXNlcjpwYXNz");
}
