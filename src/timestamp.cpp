#include "esmp/timestamp.hpp"

#include <cstdio>

namespace esmp {

using namespace std::literals;

namespace {

    // Howard Hinnant's days_from_civil: days since 1970-01-01 for a proleptic Gregorian date.
    constexpr int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    struct civil {
        int64_t y;
        unsigned m, d;
    };

    constexpr civil civil_from_days(int64_t z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return {y + (m <= 2), m, d};
    }

    constexpr bool is_leap(int64_t y) {
        return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
    }

    constexpr unsigned days_in_month(int64_t y, unsigned m) {
        constexpr unsigned dim[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return m == 2 && is_leap(y) ? 29 : dim[m - 1];
    }

    // Consumes exactly `n` decimal digits from the front of `s`.
    std::optional<int> take_digits(std::string_view& s, size_t n) {
        if (s.size() < n)
            return std::nullopt;
        int v = 0;
        for (size_t i = 0; i < n; i++) {
            if (s[i] < '0' || s[i] > '9')
                return std::nullopt;
            v = v * 10 + (s[i] - '0');
        }
        s.remove_prefix(n);
        return v;
    }

    bool take_char(std::string_view& s, std::string_view any_of) {
        if (s.empty() || any_of.find(s.front()) == std::string_view::npos)
            return false;
        s.remove_prefix(1);
        return true;
    }

}  // namespace

std::optional<sys_time> from_unix(int64_t seconds, int64_t nanos) {
    if (seconds <= MIN_UNIX_SECONDS || seconds >= MAX_UNIX_SECONDS || nanos < 0 ||
        nanos >= 1'000'000'000)
        return std::nullopt;
    return sys_time{std::chrono::duration_cast<sys_time::duration>(
            std::chrono::seconds{seconds} + std::chrono::nanoseconds{nanos})};
}

std::optional<sys_time> parse_rfc3339(std::string_view s) {
    auto year = take_digits(s, 4);
    if (!year || !take_char(s, "-"))
        return std::nullopt;
    auto month = take_digits(s, 2);
    if (!month || *month < 1 || *month > 12 || !take_char(s, "-"))
        return std::nullopt;
    auto day = take_digits(s, 2);
    if (!day || *day < 1 || *day > static_cast<int>(days_in_month(*year, *month)))
        return std::nullopt;
    if (!take_char(s, "Tt "))
        return std::nullopt;
    auto hour = take_digits(s, 2);
    if (!hour || *hour > 23 || !take_char(s, ":"))
        return std::nullopt;
    auto minute = take_digits(s, 2);
    if (!minute || *minute > 59 || !take_char(s, ":"))
        return std::nullopt;
    // 60 is allowed for leap seconds; it simply rolls into the next minute.
    auto second = take_digits(s, 2);
    if (!second || *second > 60)
        return std::nullopt;

    int64_t nanos = 0;
    if (take_char(s, ".")) {
        int digits = 0;
        while (!s.empty() && s.front() >= '0' && s.front() <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (s.front() - '0');
                digits++;
            }
            s.remove_prefix(1);
        }
        if (digits == 0)
            return std::nullopt;
        for (; digits < 9; digits++)
            nanos *= 10;
    }

    int64_t offset_minutes = 0;
    if (!take_char(s, "Zz")) {
        if (s.empty())
            return std::nullopt;
        int sign = s.front() == '-' ? -1 : 1;
        if (!take_char(s, "+-"))
            return std::nullopt;
        auto oh = take_digits(s, 2);
        if (!oh || *oh > 23 || !take_char(s, ":"))
            return std::nullopt;
        auto om = take_digits(s, 2);
        if (!om || *om > 59)
            return std::nullopt;
        offset_minutes = sign * (*oh * 60 + *om);
    }
    if (!s.empty())
        return std::nullopt;

    int64_t secs = days_from_civil(*year, *month, *day) * 86400 + *hour * 3600 + *minute * 60 +
                   *second - offset_minutes * 60;
    return from_unix(secs, nanos);
}

std::string to_rfc3339(sys_time t) {
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t.time_since_epoch()).count();
    int64_t secs = ns / 1'000'000'000;
    int64_t frac = ns % 1'000'000'000;
    if (frac < 0) {
        frac += 1'000'000'000;
        secs--;
    }
    int64_t days = secs / 86400;
    int64_t sod = secs % 86400;
    if (sod < 0) {
        sod += 86400;
        days--;
    }
    auto [y, m, d] = civil_from_days(days);

    char buf[64];
    int n = std::snprintf(
            buf,
            sizeof(buf),
            "%04lld-%02u-%02uT%02d:%02d:%02d",
            static_cast<long long>(y),
            m,
            d,
            static_cast<int>(sod / 3600),
            static_cast<int>(sod / 60 % 60),
            static_cast<int>(sod % 60));
    std::string out{buf, static_cast<size_t>(n)};
    if (frac) {
        char fbuf[16];
        std::snprintf(fbuf, sizeof(fbuf), ".%09lld", static_cast<long long>(frac));
        std::string_view f{fbuf};
        while (f.back() == '0')
            f.remove_suffix(1);
        out += f;
    }
    out += 'Z';
    return out;
}

}  // namespace esmp
