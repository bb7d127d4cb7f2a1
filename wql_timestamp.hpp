#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include "wql_error.hpp"

namespace wql
{

/// Point in time with microsecond resolution, the resolution of remote timestamps
using Timestamp = std::chrono::sys_time<std::chrono::microseconds>;

/**
 * @brief Parses a timestamp in the remote system's textual format
 *
 * Accepted forms:
 *   - "YYYYMMDDHHMMSS.ffffff+UUU": 25 characters where the last three digits
 *     are the UTC offset in minutes, e.g. "20200101120000.000000+120"
 *   - "YYYYMMDDHHMMSS.ffffff+HHMM": 26 characters, hours and minutes offset
 *
 * The first form is renormalised into the second before parsing.
 *
 * @return The instant in UTC, or an error naming the offending text
 */
Result<Timestamp> parseTimestamp(std::string_view text);

/// Formats ts as "YYYYMMDDHHMMSS.ffffff+UUU" with the given UTC offset in minutes
std::string formatTimestamp(Timestamp ts, int offsetMinutes = 0);

} // namespace wql
