#include "core/time_format.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace draftlink::timefmt {

namespace {

std::tm utc_tm(std::time_t t) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    return tm;
}

/// Read exactly `count` decimal digits starting at `pos`
std::optional<int> read_digits(std::string_view text, std::size_t pos, std::size_t count) {
    if (pos + count > text.size()) {
        return std::nullopt;
    }
    int value = 0;
    for (std::size_t i = pos; i < pos + count; ++i) {
        char c = text[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

}  // namespace

std::string rfc3339(WallTime t) {
    auto tm = utc_tm(std::chrono::system_clock::to_time_t(t));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string rfc3339_nano(WallTime t) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(t);
    if (secs > t) {
        secs -= std::chrono::seconds(1);
    }
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(t - secs).count();

    auto tm = utc_tm(std::chrono::system_clock::to_time_t(secs));
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");

    if (nanos > 0) {
        std::ostringstream frac;
        frac << std::setfill('0') << std::setw(9) << nanos;
        std::string digits = frac.str();
        while (!digits.empty() && digits.back() == '0') {
            digits.pop_back();
        }
        oss << '.' << digits;
    }
    oss << 'Z';
    return oss.str();
}

std::optional<WallTime> parse_rfc3339(std::string_view text) {
    // YYYY-MM-DDTHH:MM:SS is 19 characters
    if (text.size() < 20 || text[4] != '-' || text[7] != '-' ||
        (text[10] != 'T' && text[10] != 't') || text[13] != ':' || text[16] != ':') {
        return std::nullopt;
    }

    auto year = read_digits(text, 0, 4);
    auto month = read_digits(text, 5, 2);
    auto day = read_digits(text, 8, 2);
    auto hour = read_digits(text, 11, 2);
    auto minute = read_digits(text, 14, 2);
    auto second = read_digits(text, 17, 2);
    if (!year || !month || !day || !hour || !minute || !second) {
        return std::nullopt;
    }

    std::size_t pos = 19;
    std::int64_t nanos = 0;
    if (text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 9) {
                nanos = nanos * 10 + (text[pos] - '0');
                ++digits;
            }
            ++pos;
        }
        if (digits == 0) {
            return std::nullopt;
        }
        for (; digits < 9; ++digits) {
            nanos *= 10;
        }
    }

    int offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '+' ? 1 : -1;
        auto off_h = read_digits(text, pos + 1, 2);
        auto off_m = read_digits(text, pos + 4, 2);
        if (!off_h || !off_m || text[pos + 3] != ':') {
            return std::nullopt;
        }
        offset_seconds = sign * (*off_h * 3600 + *off_m * 60);
        pos += 6;
    } else {
        return std::nullopt;
    }
    if (pos != text.size()) {
        return std::nullopt;
    }

    std::tm tm{};
    tm.tm_year = *year - 1900;
    tm.tm_mon = *month - 1;
    tm.tm_mday = *day;
    tm.tm_hour = *hour;
    tm.tm_min = *minute;
    tm.tm_sec = *second;
    std::time_t utc = timegm(&tm);

    auto result = std::chrono::system_clock::from_time_t(utc - offset_seconds);
    return result + std::chrono::duration_cast<std::chrono::system_clock::duration>(
        std::chrono::nanoseconds(nanos));
}

std::string file_stamp(WallTime t) {
    std::time_t tt = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
    return oss.str();
}

std::string duration(std::chrono::seconds d) {
    auto total = d.count();
    if (total < 0) {
        total = 0;
    }
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::ostringstream oss;
    if (hours > 0) {
        oss << hours << 'h' << minutes << 'm';
    } else if (minutes > 0) {
        oss << minutes << 'm';
    }
    oss << seconds << 's';
    return oss.str();
}

}  // namespace draftlink::timefmt
