#include <gtest/gtest.h>
#include "provmark/errors.hpp"
#include "provmark/timestamp.hpp"
#include <string>

TEST(TimestampTest, FormatEpochAndKnownInstant) {
    ASSERT_EQ(ProvMark::Timestamp::format_iso8601(0), "1970-01-01T00:00:00.000Z");
    ASSERT_EQ(ProvMark::Timestamp::format_iso8601(1704067200123), "2024-01-01T00:00:00.123Z");
}

TEST(TimestampTest, ParseAcceptsFractionVariants) {
    ASSERT_EQ(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.123Z"), 1704067200123);
    ASSERT_EQ(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00Z"), 1704067200000);
    ASSERT_EQ(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.5Z"), 1704067200500);
    // Sub-millisecond digits are truncated.
    ASSERT_EQ(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.123999Z"), 1704067200123);
}

TEST(TimestampTest, FormatParseRoundTrip) {
    int64_t now = ProvMark::Timestamp::now_unix_millis();
    ASSERT_EQ(ProvMark::Timestamp::parse_iso8601_millis(ProvMark::Timestamp::format_iso8601(now)), now);
}

TEST(TimestampTest, ParseRejectsMalformed) {
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis(""), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01 00:00:00Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.000"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-13-01T00:00:00Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-01-01T00:00:00.1a3Z"), ProvMark::MalformedInput);
}

TEST(TimestampTest, ParseRejectsDaysPastMonthEnd) {
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-02-31T00:00:00Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2023-02-29T00:00:00Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2100-02-29T00:00:00Z"), ProvMark::MalformedInput);
    ASSERT_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-04-31T00:00:00Z"), ProvMark::MalformedInput);

    // Leap days and month ends that exist
    ASSERT_EQ(ProvMark::Timestamp::format_iso8601(ProvMark::Timestamp::parse_iso8601_millis("2024-02-29T12:00:00Z")),
              "2024-02-29T12:00:00.000Z");
    ASSERT_EQ(ProvMark::Timestamp::format_iso8601(ProvMark::Timestamp::parse_iso8601_millis("2000-02-29T00:00:00Z")),
              "2000-02-29T00:00:00.000Z");
    ASSERT_NO_THROW(ProvMark::Timestamp::parse_iso8601_millis("2024-12-31T23:59:59.999Z"));
}
