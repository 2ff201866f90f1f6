/**
 * @file Base64Test.cpp
 * @brief Unit tests for the payload base64 helpers
 */

#include <gtest/gtest.h>
#include <string>
#include <vector>

#include <canlog/util/base64.hpp>

using namespace CanLog::util;

static std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

TEST(Base64EncodeTest, Rfc4648Vectors) {
    EXPECT_EQ(base64Encode(bytes("")), "");
    EXPECT_EQ(base64Encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64Encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64Encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64Encode(bytes("foob")), "Zm9vYg==");
    EXPECT_EQ(base64Encode(bytes("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64Encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64EncodeTest, LogExamplePayload) {
    EXPECT_EQ(base64Encode(bytes("[42, 9]")), "WzQyLCA5XQ==");
}

TEST(Base64EncodeTest, StandardAlphabetNoWrapping) {
    std::vector<uint8_t> in = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64Encode(in), "+/+/");

    std::vector<uint8_t> big(300, 0xAA);
    std::string out = base64Encode(big);
    EXPECT_EQ(out.size(), 400u);
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(Base64DecodeTest, ValidInput) {
    std::vector<uint8_t> out;
    std::error_code ec;

    ASSERT_TRUE(base64Decode("WzQyLCA5XQ==", out, ec));
    EXPECT_EQ(out, bytes("[42, 9]"));

    ASSERT_TRUE(base64Decode("Zm9vYmE=", out, ec));
    EXPECT_EQ(out, bytes("fooba"));

    ASSERT_TRUE(base64Decode("", out, ec));
    EXPECT_TRUE(out.empty());
}

TEST(Base64DecodeTest, AllByteValues) {
    std::vector<uint8_t> in;
    for (int i = 0; i < 256; ++i)
        in.push_back(static_cast<uint8_t>(i));

    std::vector<uint8_t> out;
    std::error_code ec;
    ASSERT_TRUE(base64Decode(base64Encode(in), out, ec));
    EXPECT_EQ(out, in);
}

TEST(Base64DecodeTest, IgnoresSurroundingWhitespace) {
    std::vector<uint8_t> out;
    std::error_code ec;

    ASSERT_TRUE(base64Decode(" Zm9v\r\n", out, ec));
    EXPECT_EQ(out, bytes("foo"));
}

TEST(Base64DecodeTest, RejectsMalformedInput) {
    std::vector<uint8_t> out = {1, 2, 3};
    std::error_code ec;

    EXPECT_FALSE(base64Decode("Zm9", out, ec));   // length
    EXPECT_EQ(ec, std::errc::invalid_argument);
    EXPECT_FALSE(base64Decode("Zm9*", out, ec));  // alphabet
    EXPECT_TRUE(ec);
    EXPECT_FALSE(base64Decode("Zg==Zm9v", out, ec)); // padding in the middle
    EXPECT_TRUE(ec);
    EXPECT_FALSE(base64Decode("Z===", out, ec));  // too much padding
    EXPECT_TRUE(ec);
    EXPECT_FALSE(base64Decode("Zm 9v", out, ec)); // inner whitespace
    EXPECT_TRUE(ec);
    EXPECT_FALSE(base64Decode("Zm9v_-==", out, ec)); // url-safe alphabet
    EXPECT_TRUE(ec);

    // untouched on failure
    EXPECT_EQ(out, (std::vector<uint8_t>{1, 2, 3}));
}
