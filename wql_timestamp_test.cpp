#include <doctest/doctest.h>
#include "wql_timestamp.hpp"

using namespace wql;
using namespace std::chrono;

TEST_SUITE("Timestamp") {

TEST_CASE("hours and minutes offset") {
    auto parsed = parseTimestamp("20200101120000.000000+0200");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == Timestamp(sys_days(2020y / January / 1) + 10h));
}

TEST_CASE("three digit minute offset is renormalised") {
    auto minutes = parseTimestamp("20200101120000.000000+120");
    auto hours   = parseTimestamp("20200101120000.000000+0200");

    REQUIRE(minutes.has_value());
    REQUIRE(hours.has_value());
    CHECK(*minutes == *hours);
}

TEST_CASE("minute offsets that are not whole hours") {
    auto parsed = parseTimestamp("20200101120000.000000+330");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == Timestamp(sys_days(2020y / January / 1) + 6h + 30min));
}

TEST_CASE("negative offset") {
    auto parsed = parseTimestamp("20200101120000.000000-060");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == Timestamp(sys_days(2020y / January / 1) + 13h));
}

TEST_CASE("microseconds and day rollover") {
    auto parsed = parseTimestamp("20201231235959.123456-000");
    REQUIRE(parsed.has_value());
    CHECK(*parsed == Timestamp(sys_days(2020y / December / 31) + 23h + 59min + 59s + 123456us));

    auto rolled = parseTimestamp("20201231233000.000000-060");
    REQUIRE(rolled.has_value());
    CHECK(*rolled == Timestamp(sys_days(2021y / January / 1) + 30min));
}

TEST_CASE("malformed input is rejected") {
    CHECK_FALSE(parseTimestamp("").has_value());
    CHECK_FALSE(parseTimestamp("2020").has_value());
    CHECK_FALSE(parseTimestamp("20200101120000,000000+000").has_value());
    CHECK_FALSE(parseTimestamp("2020010112000a.000000+000").has_value());
    CHECK_FALSE(parseTimestamp("20200101120000.000000*000").has_value());
    CHECK_FALSE(parseTimestamp("20200101120000.000000+1x0").has_value());
    CHECK_FALSE(parseTimestamp("20200101120000.000000+02000").has_value());
}

TEST_CASE("calendar fields are range checked") {
    CHECK_FALSE(parseTimestamp("20201301120000.000000+000").has_value());
    CHECK_FALSE(parseTimestamp("20200230120000.000000+000").has_value());
    CHECK_FALSE(parseTimestamp("20200101250000.000000+000").has_value());
    CHECK_FALSE(parseTimestamp("20200101126000.000000+000").has_value());
    CHECK(parseTimestamp("20200229120000.000000+000").has_value());
}

TEST_CASE("errors name the offending text") {
    auto parsed = parseTimestamp("yesterday");
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().is(Error::Code::invalidArgument));
    CHECK(parsed.error().message().find("yesterday") != std::string::npos);
}

TEST_CASE("formatting uses a minute offset") {
    Timestamp ts(sys_days(2020y / January / 1) + 12h + 250us);

    CHECK(formatTimestamp(ts) == "20200101120000.000250+000");
    CHECK(formatTimestamp(ts, 120) == "20200101140000.000250+120");
    CHECK(formatTimestamp(ts, -90) == "20200101103000.000250-090");
}

TEST_CASE("formatted timestamps parse back to the same instant") {
    Timestamp ts(sys_days(1999y / March / 7) + 4h + 5min + 6s + 7us);

    auto parsed = parseTimestamp(formatTimestamp(ts, -330));
    REQUIRE(parsed.has_value());
    CHECK(*parsed == ts);
}

} // TEST_SUITE("Timestamp")
