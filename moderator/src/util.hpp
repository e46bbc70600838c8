#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>
#include <functional>

namespace util {
    // Milliseconds since epoch, injectable for tests
    using MillisClock = std::function<int64_t()>;

    struct CivilDate {
        int year = 1970;
        int month = 1;
        int day = 1;

        std::string to_string() const;
        int64_t days_since_epoch() const;
        CivilDate add_days(int64_t days) const;

        static CivilDate from_days(int64_t days);
        static bool parse(const std::string& text, CivilDate& out);

        bool operator<(const CivilDate& other) const {
            return days_since_epoch() < other.days_since_epoch();
        }
        bool operator==(const CivilDate& other) const {
            return year == other.year && month == other.month && day == other.day;
        }
    };

    struct LocalDateTime {
        CivilDate date;
        int hour = 0;
        int minute = 0;
        int second = 0;

        std::string to_string() const;
    };

    using LocalClock = std::function<LocalDateTime()>;

    std::string current_iso8601();
    int64_t current_timestamp_ms();
    LocalDateTime local_now();

    // Calendar date of the accounting day that started at reset_hour
    CivilDate violation_day(const LocalDateTime& at, int reset_hour);

    std::string trim(const std::string& str);
    // Full Unicode case folding (ICU), for matching user text
    std::string fold_case(const std::string& str);
    std::string to_lower_ascii(const std::string& str);
    std::vector<std::string> split(const std::string& str, char delim);
    std::string join(const std::vector<std::string>& items, const std::string& sep);

    // Fixed-width (32 hex chars) digest of arbitrary bytes
    std::string content_digest(const std::string& data);

    // Cuts at max_chars UTF-8 code points, never inside a sequence
    std::string truncate_utf8(const std::string& str, size_t max_chars);
    size_t utf8_length(const std::string& str);

    std::string redact_dsn(const std::string& dsn);
    std::string humanize_seconds(int seconds);
}
