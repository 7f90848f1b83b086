#include "provmark/timestamp.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>

#include "provmark/errors.hpp"

namespace ProvMark {
namespace Timestamp {

    namespace {
        int read_digits(const std::string& text, size_t pos, size_t count) {
            int value = 0;
            for (size_t i = pos; i < pos + count; ++i) {
                if (text[i] < '0' || text[i] > '9') {
                    throw MalformedInput("Malformed ISO-8601 timestamp: " + text);
                }
                value = value * 10 + (text[i] - '0');
            }
            return value;
        }

        // month is 0-based, year is the full Gregorian year.
        int days_in_month(int year, int month) {
            static const int DAYS[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
            const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return month == 1 && leap ? 29 : DAYS[month];
        }

        void expect(const std::string& text, size_t pos, char c) {
            if (text[pos] != c) {
                throw MalformedInput("Malformed ISO-8601 timestamp: " + text);
            }
        }
    }

    int64_t now_unix_millis() {
        using namespace std::chrono;
        return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    }

    std::string now_iso8601() {
        return format_iso8601(now_unix_millis());
    }

    std::string format_iso8601(int64_t unix_millis) {
        int64_t seconds = unix_millis / 1000;
        int64_t millis = unix_millis % 1000;
        if (millis < 0) {
            millis += 1000;
            seconds -= 1;
        }

        std::time_t t = static_cast<std::time_t>(seconds);
        std::tm tm{};
        gmtime_r(&t, &tm);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                      tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                      tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis));
        return buf;
    }

    int64_t parse_iso8601_millis(const std::string& text) {
        // Shortest accepted form: YYYY-MM-DDTHH:MM:SSZ
        if (text.size() < 20 || text.back() != 'Z') {
            throw MalformedInput("Malformed ISO-8601 timestamp: " + text);
        }

        std::tm tm{};
        tm.tm_year = read_digits(text, 0, 4) - 1900;
        expect(text, 4, '-');
        tm.tm_mon = read_digits(text, 5, 2) - 1;
        expect(text, 7, '-');
        tm.tm_mday = read_digits(text, 8, 2);
        expect(text, 10, 'T');
        tm.tm_hour = read_digits(text, 11, 2);
        expect(text, 13, ':');
        tm.tm_min = read_digits(text, 14, 2);
        expect(text, 16, ':');
        tm.tm_sec = read_digits(text, 17, 2);

        if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
            tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
            throw MalformedInput("ISO-8601 timestamp out of range: " + text);
        }
        if (tm.tm_mday > days_in_month(tm.tm_year + 1900, tm.tm_mon)) {
            throw MalformedInput("ISO-8601 timestamp has no such day: " + text);
        }

        int millis = 0;
        const size_t frac_end = text.size() - 1;
        if (frac_end > 19) {
            expect(text, 19, '.');
            const size_t digits = frac_end - 20;
            if (digits == 0) {
                throw MalformedInput("Malformed ISO-8601 timestamp: " + text);
            }
            for (size_t i = 20; i < frac_end; ++i) {
                if (text[i] < '0' || text[i] > '9') {
                    throw MalformedInput("Malformed ISO-8601 timestamp: " + text);
                }
            }
            const size_t used = digits < 3 ? digits : 3;
            millis = read_digits(text, 20, used);
            for (size_t i = used; i < 3; ++i) {
                millis *= 10;
            }
        }

        const int64_t seconds = static_cast<int64_t>(timegm(&tm));
        return seconds * 1000 + millis;
    }

} // namespace Timestamp
} // namespace ProvMark
