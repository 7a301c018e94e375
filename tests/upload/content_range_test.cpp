#include "collector/upload/content_range.hpp"

#include <gtest/gtest.h>

using collector::ErrorCode;
using collector::upload::ContentRange;
using collector::upload::RangeState;
using collector::upload::make_range_header;
using collector::upload::parse_content_range;
using collector::upload::parse_status_range;
using collector::upload::validate_chunk;

TEST(ContentRangeParse, ReadsStartEndAndTotal) {
    auto range = parse_content_range("bytes 1000-1499/1500");
    ASSERT_TRUE(range.is_ok());
    EXPECT_EQ(range.value().start, 1000u);
    EXPECT_EQ(range.value().end, 1499u);
    EXPECT_EQ(range.value().total_length, 1500u);
    EXPECT_EQ(range.value().length(), 500u);
    EXPECT_TRUE(range.value().is_final());
}

TEST(ContentRangeParse, RejectsOtherUnitsAndGarbage) {
    EXPECT_TRUE(parse_content_range("items 0-9/10").is_error());
    EXPECT_TRUE(parse_content_range("bytes 0-9").is_error());
    EXPECT_TRUE(parse_content_range("bytes a-9/10").is_error());
    EXPECT_TRUE(parse_content_range("bytes 9/0-10").is_error());
    EXPECT_TRUE(parse_content_range("").is_error());
}

TEST(ContentRangeParse, StatusQueryCarriesOnlyTotal) {
    auto total = parse_status_range("bytes */4096");
    ASSERT_TRUE(total.is_ok());
    EXPECT_EQ(total.value(), 4096u);

    EXPECT_TRUE(parse_status_range("bytes 0-1/2").is_error());
    EXPECT_TRUE(parse_status_range("bytes */").is_error());
}

TEST(ContentRangeValidate, FirstChunkMustStartAtZero) {
    EXPECT_TRUE(validate_chunk(std::nullopt, ContentRange{0, 999, 1500}, 1000).is_ok());

    auto late = validate_chunk(std::nullopt, ContentRange{1000, 1499, 1500}, 500);
    ASSERT_TRUE(late.is_error());
    EXPECT_EQ(late.error().code, ErrorCode::ContentRangeMismatch);
}

TEST(ContentRangeValidate, NextChunkMustContinueExactly) {
    const RangeState state{1000, 1500};

    EXPECT_TRUE(validate_chunk(state, ContentRange{1000, 1499, 1500}, 500).is_ok());

    auto gap = validate_chunk(state, ContentRange{1001, 1499, 1500}, 499);
    ASSERT_TRUE(gap.is_error());
    EXPECT_EQ(gap.error().code, ErrorCode::ContentRangeMismatch);

    auto overlap = validate_chunk(state, ContentRange{900, 1499, 1500}, 600);
    ASSERT_TRUE(overlap.is_error());
    EXPECT_EQ(overlap.error().code, ErrorCode::ContentRangeMismatch);
}

TEST(ContentRangeValidate, TotalLengthIsFixedBySession) {
    auto changed = validate_chunk(RangeState{1000, 1500}, ContentRange{1000, 1999, 2000}, 1000);
    ASSERT_TRUE(changed.is_error());
    EXPECT_EQ(changed.error().code, ErrorCode::ContentRangeMismatch);
}

TEST(ContentRangeValidate, PayloadSizeMustMatchRange) {
    auto result = validate_chunk(std::nullopt, ContentRange{0, 999, 1500}, 998);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().code, ErrorCode::ContentRangeNotMatchingFileSize);
}

TEST(ContentRangeValidate, RejectsInvertedAndOutOfBoundsRanges) {
    EXPECT_EQ(validate_chunk(std::nullopt, ContentRange{5, 4, 10}, 0).error().code,
              ErrorCode::ContentRangeMismatch);
    EXPECT_EQ(validate_chunk(std::nullopt, ContentRange{0, 10, 10}, 11).error().code,
              ErrorCode::ContentRangeMismatch);
    EXPECT_EQ(validate_chunk(std::nullopt, ContentRange{0, 0, 0}, 1).error().code,
              ErrorCode::ContentRangeMismatch);
}

TEST(ContentRangeHeader, FormatsInclusiveEnd) {
    EXPECT_EQ(make_range_header(1000), "bytes=0-999");
    EXPECT_EQ(make_range_header(1), "bytes=0-0");
    EXPECT_EQ(make_range_header(0), "");
}
