#include "wql_timestamp.hpp"

#include <charconv>
#include <cstdlib>
#include <format>

namespace wql
{
namespace
{
constexpr std::size_t kMinuteOffsetLength = 25;
constexpr std::size_t kHourOffsetLength   = 26;
constexpr std::size_t kSignPosition       = 21;

bool parseDigits(std::string_view text, std::size_t pos, std::size_t count, int& out)
{
    auto const digits = text.substr(pos, count);

    if (digits.size() != count)
        return false;

    for (auto c : digits)
        if (c < '0' || c > '9')
            return false;

    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out);
    return ec == std::errc() && ptr == digits.data() + digits.size();
}

Result<std::string> normaliseOffset(std::string_view text)
{
    if (text.size() != kMinuteOffsetLength)
        return std::string(text);

    int minutes = 0;
    if (! parseDigits(text, kSignPosition + 1, 3, minutes))
        return fail(Error::Code::invalidArgument, std::format("invalid minute offset in timestamp \"{}\"", text));

    return std::format("{}{:02}{:02}", text.substr(0, kSignPosition + 1), minutes / 60, minutes % 60);
}
} // namespace

//=============================================================================
// Timestamp implementations
//=============================================================================

Result<Timestamp> parseTimestamp(std::string_view text)
{
    auto normalised = normaliseOffset(text);
    if (! normalised)
        return std::unexpected(normalised.error());

    std::string_view const s = *normalised;
    auto const invalid = [text] { return fail(Error::Code::invalidArgument, std::format("cannot parse timestamp \"{}\"", text)); };

    if (s.size() != kHourOffsetLength || s[14] != '.' || (s[kSignPosition] != '+' && s[kSignPosition] != '-'))
        return invalid();

    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, micros = 0, offsetHours = 0, offsetMinutes = 0;

    auto const ok = parseDigits(s,  0, 4, year)   && parseDigits(s,  4, 2, month)  && parseDigits(s,  6, 2, day)
                 && parseDigits(s,  8, 2, hour)   && parseDigits(s, 10, 2, minute) && parseDigits(s, 12, 2, second)
                 && parseDigits(s, 15, 6, micros)
                 && parseDigits(s, 22, 2, offsetHours) && parseDigits(s, 24, 2, offsetMinutes);

    if (! ok || hour > 23 || minute > 59 || second > 59 || offsetMinutes > 59)
        return invalid();

    std::chrono::year_month_day const date { std::chrono::year(year),
                                             std::chrono::month(static_cast<unsigned>(month)),
                                             std::chrono::day(static_cast<unsigned>(day)) };
    if (! date.ok())
        return invalid();

    auto const offset = std::chrono::hours(offsetHours) + std::chrono::minutes(offsetMinutes);
    auto const local = std::chrono::sys_days(date) + std::chrono::hours(hour) + std::chrono::minutes(minute)
                     + std::chrono::seconds(second) + std::chrono::microseconds(micros);

    return Timestamp(s[kSignPosition] == '+' ? local - offset : local + offset);
}

std::string formatTimestamp(Timestamp ts, int offsetMinutes)
{
    auto const local = ts + std::chrono::minutes(offsetMinutes);
    auto const days = std::chrono::floor<std::chrono::days>(local);
    std::chrono::year_month_day const date(days);
    std::chrono::hh_mm_ss const time(local - days);

    return std::format("{:04}{:02}{:02}{:02}{:02}{:02}.{:06}{}{:03}",
                       static_cast<int>(date.year()), static_cast<unsigned>(date.month()), static_cast<unsigned>(date.day()),
                       time.hours().count(), time.minutes().count(), time.seconds().count(),
                       time.subseconds().count(),
                       offsetMinutes < 0 ? '-' : '+', std::abs(offsetMinutes));
}
} // namespace wql
