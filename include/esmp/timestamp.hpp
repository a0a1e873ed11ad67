#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "types.hpp"

namespace esmp {

/// Whole Unix seconds strictly inside this range fit in a `sys_time` together with any fraction
/// of a second (roughly years 1678 to 2262).
inline constexpr int64_t MIN_UNIX_SECONDS =
        std::chrono::duration_cast<std::chrono::seconds>(sys_time::min().time_since_epoch()).count();
inline constexpr int64_t MAX_UNIX_SECONDS =
        std::chrono::duration_cast<std::chrono::seconds>(sys_time::max().time_since_epoch()).count();

/// Converts Unix seconds plus nanoseconds (0 to 999999999) to an instant, or returns std::nullopt
/// if the instant is outside the range `sys_time` can hold.
std::optional<sys_time> from_unix(int64_t seconds, int64_t nanos = 0);

/// API: timestamp/parse_rfc3339
///
/// Parses an RFC 3339 instant such as "2024-05-01T12:00:00Z" or
/// "2024-05-01T14:00:00.250+02:00".  The `T` separator may also be a space or lowercase `t`, and
/// `Z` may be lowercase.  Fractional seconds are kept to nanosecond precision (further digits are
/// truncated).
///
/// Outputs:
/// - the instant, or std::nullopt if `s` is not a valid RFC 3339 date-time or is outside the range
///   of `sys_time` (see `MIN_UNIX_SECONDS`).
std::optional<sys_time> parse_rfc3339(std::string_view s);

/// Formats an instant as UTC RFC 3339, e.g. "2024-05-01T12:00:00Z".  Sub-second precision is
/// appended only when non-zero, with trailing zeroes removed.
std::string to_rfc3339(sys_time t);

}  // namespace esmp
