/**
 * @file RecordErrorTest.cpp
 * @brief Unit tests for the canlog.record error category
 */

#include <cerrno>
#include <gtest/gtest.h>
#include <system_error>

#include <canlog/record/RecordError.hpp>

using namespace CanLog;

TEST(RecordErrorTest, CategoryName) {
    std::error_code ec = RecordErrc::FieldCount;
    EXPECT_STREQ(ec.category().name(), "canlog.record");
    EXPECT_EQ(ec.value(), 1);
}

TEST(RecordErrorTest, EveryCodeIsInvalidArgument) {
    const RecordErrc all[] = {RecordErrc::FieldCount, RecordErrc::Timestamp,
                              RecordErrc::ArbitrationId, RecordErrc::Dlc, RecordErrc::Data};
    for (RecordErrc e : all) {
        std::error_code ec = make_error_code(e);
        EXPECT_TRUE(ec == std::errc::invalid_argument) << ec.message();
        EXPECT_TRUE(isMalformedRecord(ec));
        EXPECT_FALSE(ec.message().empty());
    }
}

TEST(RecordErrorTest, SystemErrorsAreNotMalformedRecords) {
    EXPECT_FALSE(isMalformedRecord(std::make_error_code(std::errc::invalid_argument)));
    EXPECT_FALSE(isMalformedRecord(std::error_code(EIO, std::generic_category())));
    EXPECT_FALSE(isMalformedRecord(std::error_code()));
}

TEST(RecordErrorTest, DistinctCodes) {
    std::error_code a = RecordErrc::Timestamp;
    std::error_code b = RecordErrc::Data;
    EXPECT_NE(a, b);
    EXPECT_EQ(a, RecordErrc::Timestamp);
}
