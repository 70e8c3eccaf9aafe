#include "hexfire/timestamp.hpp"

#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace hexfire {

    namespace {

        bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

        unsigned daysInMonth(int y, unsigned m) {
            static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            return (m == 2 && isLeap(y)) ? 29 : kDays[m - 1];
        }

        // Reads exactly n digits at pos.
        bool digits(const std::string &s, std::size_t pos, std::size_t n, int &out) {
            if (pos + n > s.size())
                return false;
            int v = 0;
            for (std::size_t i = pos; i < pos + n; ++i) {
                if (s[i] < '0' || s[i] > '9')
                    return false;
                v = v * 10 + (s[i] - '0');
            }
            out = v;
            return true;
        }

        bool parseDatePart(const std::string &s, int &y, int &m, int &d) {
            if (s.size() < 10 || s[4] != '-' || s[7] != '-')
                return false;
            if (!digits(s, 0, 4, y) || !digits(s, 5, 2, m) || !digits(s, 8, 2, d))
                return false;
            if (m < 1 || m > 12 || d < 1 || static_cast<unsigned>(d) > daysInMonth(y, static_cast<unsigned>(m)))
                return false;
            return true;
        }

        // Accepts Z or +HH:MM / -HH:MM / +HHMM / +HH at pos, consuming to the end of the string.
        bool parseZone(const std::string &s, std::size_t pos) {
            if (pos == s.size())
                return true;
            if (s[pos] == 'Z' || s[pos] == 'z')
                return pos + 1 == s.size();
            if (s[pos] != '+' && s[pos] != '-')
                return false;
            int hh = 0, mm = 0;
            if (!digits(s, pos + 1, 2, hh) || hh > 23)
                return false;
            std::size_t p = pos + 3;
            if (p == s.size())
                return true;
            if (s[p] == ':')
                ++p;
            if (!digits(s, p, 2, mm) || mm > 59)
                return false;
            return p + 2 == s.size();
        }

    } // namespace

    std::int64_t DaysFromCivil(int y, unsigned m, unsigned d) noexcept {
        y -= m <= 2;
        const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
    }

    std::optional<double> ParseTimestamp(const std::string &s) {
        int y = 0, mo = 0, d = 0;
        if (!parseDatePart(s, y, mo, d))
            return std::nullopt;

        double seconds =
            static_cast<double>(DaysFromCivil(y, static_cast<unsigned>(mo), static_cast<unsigned>(d)) * kSecondsPerDay);
        if (s.size() == 10)
            return seconds;
        if (s[10] != 'T' && s[10] != ' ')
            return std::nullopt;

        int hh = 0, mm = 0, ss = 0;
        std::size_t pos = 11;
        if (!digits(s, pos, 2, hh) || hh > 23)
            return std::nullopt;
        pos += 2;
        if (pos < s.size() && s[pos] == ':') {
            if (!digits(s, pos + 1, 2, mm) || mm > 59)
                return std::nullopt;
            pos += 3;
            if (pos < s.size() && s[pos] == ':') {
                if (!digits(s, pos + 1, 2, ss) || ss > 59)
                    return std::nullopt;
                pos += 3;
                if (pos < s.size() && (s[pos] == '.' || s[pos] == ',')) {
                    std::size_t start = ++pos;
                    double frac = 0.0, scale = 0.1;
                    while (pos < s.size() && s[pos] >= '0' && s[pos] <= '9') {
                        frac += (s[pos] - '0') * scale;
                        scale /= 10.0;
                        ++pos;
                    }
                    if (pos == start)
                        return std::nullopt;
                    seconds += frac;
                }
            }
        }
        if (!parseZone(s, pos))
            return std::nullopt;

        return seconds + hh * 3600.0 + mm * 60.0 + ss;
    }

    std::optional<double> ParseTimestamp(const std::optional<std::string> &raw) {
        if (!raw || raw->empty())
            return std::nullopt;
        return ParseTimestamp(*raw);
    }

    std::optional<std::string> ResolveTimeField(const FireProperties &props) {
        for (auto const *field : {&props.time_floor, &props.time, &props.timestamp}) {
            if (*field && !(*field)->empty())
                return **field;
        }
        return std::nullopt;
    }

    std::optional<ResolvedTime> ResolveTime(const FireProperties &props) {
        auto raw = ResolveTimeField(props);
        auto epoch = ParseTimestamp(raw);
        if (!epoch)
            return std::nullopt;
        return ResolvedTime{std::move(*raw), *epoch};
    }

    DayBucket DayBucketFor(double epoch) {
        const auto days = static_cast<std::int64_t>(std::floor(epoch / static_cast<double>(kSecondsPerDay)));
        DayBucket b;
        b.start = days * kSecondsPerDay;
        b.end = b.start + kSecondsPerDay;

        // civil_from_days
        const std::int64_t z = days + 719468;
        const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
        b.label = buf;
        return b;
    }

    std::int64_t ParseDate(const std::string &text) {
        int y = 0, m = 0, d = 0;
        if (text.size() != 10 || !parseDatePart(text, y, m, d))
            throw std::invalid_argument("Invalid date: " + text);
        return DaysFromCivil(y, static_cast<unsigned>(m), static_cast<unsigned>(d)) * kSecondsPerDay;
    }

    std::string FormatTimestamp(double epoch) {
        const auto total = static_cast<std::int64_t>(std::llround(epoch * 1e6));
        std::int64_t secs = total / 1000000;
        std::int64_t micros = total % 1000000;
        if (micros < 0) {
            micros += 1000000;
            --secs;
        }
        const auto bucket = DayBucketFor(static_cast<double>(secs));
        const auto whole = secs - bucket.start;

        char buf[64];
        if (micros == 0) {
            std::snprintf(buf, sizeof(buf), "%sT%02lld:%02lld:%02lldZ", bucket.label.c_str(),
                          static_cast<long long>(whole / 3600), static_cast<long long>(whole / 60 % 60),
                          static_cast<long long>(whole % 60));
        } else {
            std::snprintf(buf, sizeof(buf), "%sT%02lld:%02lld:%02lld.%06lldZ", bucket.label.c_str(),
                          static_cast<long long>(whole / 3600), static_cast<long long>(whole / 60 % 60),
                          static_cast<long long>(whole % 60), static_cast<long long>(micros));
        }
        return buf;
    }

} // namespace hexfire
