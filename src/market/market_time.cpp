#include "market/market_time.hpp"

#include <date/date.h>
#include <date/tz.h>

#include <cstdio>
#include <sstream>
#include <string>

namespace market {

static constexpr const char* kExchangeZone = "America/New_York";

// locate_zone throws if the tz database has no entry
static const date::time_zone* exchange_zone()
{
    static const date::time_zone* zone = date::locate_zone(kExchangeZone);
    return zone;
}

static date::sys_days to_sys_days(Date d)
{
    return date::sys_days{date::days{d.days}};
}

static Date from_sys_days(date::sys_days d)
{
    return Date{static_cast<int>(d.time_since_epoch().count())};
}

static date::year_month_day to_ymd(Date d)
{
    return date::year_month_day{to_sys_days(d)};
}

// *
// **
// ***
// ****
// ***** CIVIL CALENDAR

Date Date::from_ymd(int year, int month, int day)
{
    return from_sys_days(date::year{year} / month / day);
}

int Date::year() const { return static_cast<int>(to_ymd(*this).year()); }
int Date::month() const { return static_cast<int>(static_cast<unsigned>(to_ymd(*this).month())); }
int Date::day() const { return static_cast<int>(static_cast<unsigned>(to_ymd(*this).day())); }

int Date::weekday() const
{
    return static_cast<int>(date::weekday{to_sys_days(*this)}.c_encoding());
}

// *
// **
// ***
// ****
// ***** EXCHANGE TIME

int exchange_utc_offset(TimePoint utc)
{
    const auto info = exchange_zone()->get_info(date::floor<std::chrono::seconds>(utc));
    return static_cast<int>(info.offset.count());
}

LocalTime to_exchange_local(TimePoint utc)
{
    const auto local = exchange_zone()->to_local(date::floor<std::chrono::seconds>(utc));
    const auto day = date::floor<date::days>(local);
    const date::hh_mm_ss<std::chrono::seconds> tod{local - day};

    LocalTime out;
    out.date = Date{static_cast<int>(day.time_since_epoch().count())};
    out.hour = static_cast<int>(tod.hours().count());
    out.minute = static_cast<int>(tod.minutes().count());
    out.second = static_cast<int>(tod.seconds().count());
    return out;
}

TimePoint from_exchange_local(Date date, int hour, int minute, int second)
{
    const date::local_seconds local = date::local_days{date::days{date.days}} +
                                      std::chrono::hours{hour} +
                                      std::chrono::minutes{minute} +
                                      std::chrono::seconds{second};
    // skipped and repeated wall times resolve to the earlier instant
    return exchange_zone()->to_sys(local, date::choose::earliest);
}

Date exchange_date(TimePoint utc)
{
    return to_exchange_local(utc).date;
}

bool is_market_hours(TimePoint utc)
{
    const LocalTime t = to_exchange_local(utc);
    const int wd = t.date.weekday();
    if (wd == 0 || wd == 6) return false;

    const int minutes = t.hour * 60 + t.minute;
    return minutes >= 9 * 60 + 30 && minutes < 16 * 60;
}

TimePoint next_top_of_hour(TimePoint now)
{
    return date::floor<std::chrono::hours>(now) + std::chrono::hours{1};
}

// *
// **
// ***
// ****
// ***** PARSING / FORMATTING

// The whole of s must match fmt.
template <class Parsed>
static bool parse_exact(std::string_view s, const char* fmt, Parsed& out)
{
    std::istringstream in{std::string(s)};
    in >> date::parse(fmt, out);
    return !in.fail() && in.peek() == std::istringstream::traits_type::eof();
}

std::optional<Date> parse_iso_date(std::string_view s)
{
    if (s.size() != 10) return std::nullopt;

    date::sys_days d;
    if (!parse_exact(s, "%Y-%m-%d", d)) return std::nullopt;
    return from_sys_days(d);
}

// two-digit years pivot at 69
std::optional<Date> parse_short_month_date(std::string_view s)
{
    date::sys_days d;
    if (!parse_exact(s, "%d-%b-%y", d)) return std::nullopt;
    return from_sys_days(d);
}

std::optional<TimePoint> parse_utc_timestamp(std::string_view s)
{
    if (s.size() != 20) return std::nullopt;

    date::sys_seconds t;
    if (!parse_exact(s, "%Y-%m-%dT%H:%M:%SZ", t)) return std::nullopt;
    return TimePoint{t};
}

std::string format_short_date(Date date)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d/%d/%02d", date.month(), date.day(), date.year() % 100);
    return buf;
}

std::string format_refresh_time(TimePoint utc)
{
    const LocalTime t = to_exchange_local(utc);
    const int hour12 = t.hour % 12 == 0 ? 12 : t.hour % 12;

    char buf[32];
    std::snprintf(buf,
                  sizeof(buf),
                  "%d/%d/%02d %d:%02d %s",
                  t.date.month(),
                  t.date.day(),
                  t.date.year() % 100,
                  hour12,
                  t.minute,
                  t.hour < 12 ? "AM" : "PM");
    return buf;
}

std::string format_long_date(Date date)
{
    return date::format("%b %d, %Y", to_sys_days(date));
}

} // namespace market
