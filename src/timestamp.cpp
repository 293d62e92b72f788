/**
 * @file timestamp.cpp
 * @brief Time-argument parsing and formatting.
 */

#include <geouuid/timestamp.hpp>

#include <charconv>
#include <cmath>
#include <cstdio>

namespace geouuid {

namespace {

/// Read exactly @p count decimal digits starting at @p pos
bool read_digits(std::string_view text, std::size_t pos, std::size_t count, int& value) noexcept {
    if (pos + count > text.size()) {
        return false;
    }
    int result = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return false;
        }
        result = result * 10 + (c - '0');
    }
    value = result;
    return true;
}

bool expect(std::string_view text, std::size_t pos, char c) noexcept {
    return pos < text.size() && text[pos] == c;
}

bool is_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

constexpr std::int64_t MS_PER_DAY = 86400000;

/// Years with more than four digits need a sign and at most this many digits
constexpr std::size_t MAX_YEAR_DIGITS = 6;

bool is_leap(std::int64_t y) noexcept {
    return y % 4 == 0 && (y % 100 != 0 || y % 400 == 0);
}

int days_in_month(std::int64_t y, int m) noexcept {
    constexpr int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : DAYS[m - 1];
}

// Proleptic Gregorian conversions on 64-bit day counts (1970-01-01 = day 0)
std::int64_t days_from_civil(std::int64_t y, int m, int d) noexcept {
    y -= (m <= 2) ? 1 : 0;
    std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    std::int64_t yoe = y - era * 400;
    std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, int& m, int& d) noexcept {
    z += 719468;
    std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    std::int64_t doe = z - era * 146097;
    std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    std::int64_t mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = yoe + era * 400 + (m <= 2 ? 1 : 0);
}

/**
 * Read YYYY, or a signed year of 4 to MAX_YEAR_DIGITS digits.
 * @return Position after the year, 0 on failure
 */
std::size_t read_year(std::string_view text, std::int64_t& year) noexcept {
    std::size_t pos = 0;
    std::int64_t sign = 1;
    if (expect(text, 0, '+') || expect(text, 0, '-')) {
        sign = (text[0] == '-') ? -1 : 1;
        pos = 1;
    }
    std::size_t start = pos;
    std::int64_t value = 0;
    while (pos < text.size() && is_digit(text[pos]) && pos - start < MAX_YEAR_DIGITS) {
        value = value * 10 + (text[pos] - '0');
        ++pos;
    }
    std::size_t digits = pos - start;
    if (digits < 4 || (start == 0 && digits != 4)) {
        return 0;
    }
    if (pos < text.size() && is_digit(text[pos])) {
        return 0;
    }
    year = sign * value;
    return pos;
}

} // namespace

Timestamp system_now() noexcept {
    return std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

Clock system_clock() {
    return [] { return system_now(); };
}

Error parse_millis(std::string_view text, Timestamp& out) noexcept {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return Error::InvalidTime;
        }
    }
    if (text.empty()) {
        return Error::InvalidTime;
    }

    std::int64_t value = 0;
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return Error::InvalidTime;
    }

    out = from_millis(value);
    return Error::Ok;
}

Error parse_iso8601(std::string_view text, Timestamp& out) noexcept {
    std::int64_t year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;

    // [+-]YYYY[YY]-MM-DD
    std::size_t pos = read_year(text, year);
    if (pos == 0 || !expect(text, pos, '-') || !read_digits(text, pos + 1, 2, month) ||
        !expect(text, pos + 3, '-') || !read_digits(text, pos + 4, 2, day)) {
        return Error::InvalidTime;
    }
    pos += 6;

    if (!(expect(text, pos, 'T') || expect(text, pos, 't') || expect(text, pos, ' '))) {
        return Error::InvalidTime;
    }

    // HH:MM:SS
    if (!read_digits(text, pos + 1, 2, hour) || !expect(text, pos + 3, ':') ||
        !read_digits(text, pos + 4, 2, minute) || !expect(text, pos + 6, ':') ||
        !read_digits(text, pos + 7, 2, second)) {
        return Error::InvalidTime;
    }
    pos += 9;

    int millis = 0;
    if (expect(text, pos, '.')) {
        ++pos;
        std::size_t digits = 0;
        while (pos < text.size() && is_digit(text[pos])) {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) {
            return Error::InvalidTime;
        }
        for (std::size_t i = digits; i < 3; ++i) {
            millis *= 10;
        }
    }

    int offset_minutes = 0;
    if (expect(text, pos, 'Z') || expect(text, pos, 'z')) {
        ++pos;
    } else if (expect(text, pos, '+') || expect(text, pos, '-')) {
        int sign = (text[pos] == '-') ? -1 : 1;
        int offset_hour = 0;
        int offset_minute = 0;
        if (!read_digits(text, pos + 1, 2, offset_hour) || !expect(text, pos + 3, ':') ||
            !read_digits(text, pos + 4, 2, offset_minute)) {
            return Error::InvalidTime;
        }
        if (offset_hour > 23 || offset_minute > 59) {
            return Error::InvalidTime;
        }
        offset_minutes = sign * (offset_hour * 60 + offset_minute);
        pos += 6;
    } else {
        return Error::InvalidTime;
    }

    if (pos != text.size()) {
        return Error::InvalidTime;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
        minute > 59 || second > 59) {
        return Error::InvalidTime;
    }

    std::int64_t ms = days_from_civil(year, month, day) * MS_PER_DAY;
    ms += ((hour * 60 + minute - offset_minutes) * 60 + second) * std::int64_t{1000};
    ms += millis;

    out = from_millis(ms);
    return Error::Ok;
}

Error parse_time(std::string_view text, Timestamp& out) noexcept {
    if (parse_millis(text, out) == Error::Ok) {
        return Error::Ok;
    }
    return parse_iso8601(text, out);
}

Error millis_from_double(double millis, Timestamp& out) noexcept {
    if (!std::isfinite(millis)) {
        return Error::InvalidTime;
    }
    double truncated = std::trunc(millis);
    // [-2^63, 2^63)
    if (truncated < -9223372036854775808.0 || truncated >= 9223372036854775808.0) {
        return Error::InvalidTime;
    }
    out = from_millis(static_cast<std::int64_t>(truncated));
    return Error::Ok;
}

Error resolve_time(const TimeArgument& argument, const Clock& clock, Timestamp& out) {
    if (std::holds_alternative<std::monostate>(argument)) {
        if (!clock) {
            return Error::InvalidArg;
        }
        out = clock();
        return Error::Ok;
    }
    if (const double* millis = std::get_if<double>(&argument)) {
        return millis_from_double(*millis, out);
    }
    return parse_time(std::get<std::string>(argument), out);
}

std::string format_iso8601(Timestamp ts) {
    std::int64_t ms = to_millis(ts);
    std::int64_t days = ms / MS_PER_DAY;
    std::int64_t ms_of_day = ms % MS_PER_DAY;
    if (ms_of_day < 0) {
        ms_of_day += MS_PER_DAY;
        --days;
    }

    std::int64_t year = 0;
    int month = 0;
    int day = 0;
    civil_from_days(days, year, month, day);

    int hour = static_cast<int>(ms_of_day / 3600000);
    int minute = static_cast<int>((ms_of_day / 60000) % 60);
    int second = static_cast<int>((ms_of_day / 1000) % 60);
    int millis = static_cast<int>(ms_of_day % 1000);

    // Years outside 0000-9999 carry an explicit sign
    char year_text[24];
    if (year >= 0 && year <= 9999) {
        std::snprintf(year_text, sizeof(year_text), "%04lld", static_cast<long long>(year));
    } else {
        std::snprintf(year_text, sizeof(year_text), "%c%04lld", year < 0 ? '-' : '+',
                      static_cast<long long>(year < 0 ? -year : year));
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%s-%02d-%02dT%02d:%02d:%02d.%03dZ", year_text, month,
                  day, hour, minute, second, millis);
    return std::string(buffer);
}

} // namespace geouuid
