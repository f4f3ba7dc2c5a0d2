#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace market {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Calendar day in exchange-local (New York) time, stored as days since
// 1970-01-01. No time of day.
struct Date {
    int days = 0;

    static Date from_ymd(int year, int month, int day);

    int year() const;
    int month() const;
    int day() const;
    int weekday() const; // 0 = Sunday

    Date operator+(int n) const { return Date{days + n}; }
    Date operator-(int n) const { return Date{days - n}; }

    friend bool operator==(Date a, Date b) { return a.days == b.days; }
    friend bool operator!=(Date a, Date b) { return a.days != b.days; }
    friend bool operator<(Date a, Date b) { return a.days < b.days; }
    friend bool operator<=(Date a, Date b) { return a.days <= b.days; }
    friend bool operator>(Date a, Date b) { return a.days > b.days; }
    friend bool operator>=(Date a, Date b) { return a.days >= b.days; }
};

struct LocalTime {
    Date date;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// *
// **
// ***
// ****
// ***** EXCHANGE TIME

// America/New_York offset from UTC at the given instant, in seconds
// (-18000 or -14400 since 1967).
int exchange_utc_offset(TimePoint utc);

LocalTime to_exchange_local(TimePoint utc);
TimePoint from_exchange_local(Date date, int hour, int minute, int second = 0);

Date exchange_date(TimePoint utc);

bool is_market_hours(TimePoint utc);

// First whole hour strictly after now.
TimePoint next_top_of_hour(TimePoint now);

// *
// **
// ***
// ****
// ***** PARSING / FORMATTING

// 2006-01-02
std::optional<Date> parse_iso_date(std::string_view s);
// 2-Jan-06
std::optional<Date> parse_short_month_date(std::string_view s);
// 2006-01-02T15:04:05Z
std::optional<TimePoint> parse_utc_timestamp(std::string_view s);

// 1/2/06
std::string format_short_date(Date date);
// 1/2/06 3:04 PM, exchange-local
std::string format_refresh_time(TimePoint utc);
// Jan 02, 2006
std::string format_long_date(Date date);

} // namespace market
