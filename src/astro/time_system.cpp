/// @file time_system.cpp
/// @brief Implementation of civil time and Julian Day utilities.

#include "astro/time_system.hpp"

#include "core/types.hpp"

#include <spdlog/fmt/chrono.h>
#include <spdlog/fmt/fmt.h>

#include <chrono>
#include <cmath>
#include <ctime>

namespace gochara::astro
{

// -----------------------------------------------------------------
// Julian Day: Meeus algorithm (Astronomical Algorithms, Ch. 7)
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 y = dt.year;
    i32 m = dt.month;

    // Jan and Feb are treated as months 13 and 14 of the previous year
    if (m <= 2)
    {
        y -= 1;
        m += 12;
    }

    // Gregorian calendar correction
    const i32 a = y / 100;
    const i32 b = 2 - a + (a / 4);

    // Day fraction from hours, minutes, seconds
    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    const f64 jd = std::floor(365.25 * static_cast<f64>(y + 4716))
                 + std::floor(30.6001 * static_cast<f64>(m + 1))
                 + static_cast<f64>(dt.day)
                 + day_fraction
                 + static_cast<f64>(b)
                 - 1524.5;

    return jd;
}

// -----------------------------------------------------------------
// Julian Day → civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Add 0.5 to shift from noon-based to midnight-based
    const f64 jd_plus = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(jd_plus));
    const f64 f = jd_plus - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor(
            (static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor(
        (static_cast<f64>(b) - 122.1) / 365.25));
    const i32 d = static_cast<i32>(std::floor(
        365.25 * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(
        static_cast<f64>(b - d) / 30.6001));

    // Day (with fractional part)
    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + f;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const f64 day_frac = day_with_fraction - static_cast<f64>(day);

    // Month
    i32 month = (e < 14) ? (e - 1) : (e - 13);

    // Year
    i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Time from day fraction
    const f64 hours_total = day_frac * 24.0;
    const i32 hour = static_cast<i32>(std::floor(hours_total));

    const f64 minutes_total = (hours_total - static_cast<f64>(hour)) * 60.0;
    const i32 minute = static_cast<i32>(std::floor(minutes_total));

    const f64 second = (minutes_total - static_cast<f64>(minute)) * 60.0;

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = hour,
        .minute = minute,
        .second = second,
    };
}

// -----------------------------------------------------------------
// Local civil time → UT (subtract the offset as a duration)
// -----------------------------------------------------------------

DateTime TimeSystem::to_universal(const DateTime& local, f64 utc_offset_hours)
{
    using namespace std::chrono;

    const sys_days date = year{local.year}
                        / month{static_cast<unsigned>(local.month)}
                        / day{static_cast<unsigned>(local.day)};

    const f64 whole_second = std::floor(local.second);
    const f64 second_fraction = local.second - whole_second;

    const seconds offset{std::llround(utc_offset_hours * 3600.0)};

    const sys_seconds ut = date
                         + hours{local.hour}
                         + minutes{local.minute}
                         + seconds{static_cast<i64>(whole_second)}
                         - offset;

    const sys_days ut_date = std::chrono::floor<days>(ut);
    const year_month_day ymd{ut_date};
    const hh_mm_ss<seconds> time_of_day{ut - ut_date};

    return DateTime{
        .year   = static_cast<i32>(ymd.year()),
        .month  = static_cast<i32>(static_cast<unsigned>(ymd.month())),
        .day    = static_cast<i32>(static_cast<unsigned>(ymd.day())),
        .hour   = static_cast<i32>(time_of_day.hours().count()),
        .minute = static_cast<i32>(time_of_day.minutes().count()),
        .second = static_cast<f64>(time_of_day.seconds().count()) + second_fraction,
    };
}

f64 TimeSystem::julian_day_ut(const DateTime& local, f64 utc_offset_hours)
{
    return to_julian_date(to_universal(local, utc_offset_hours));
}

// -----------------------------------------------------------------
// Month calendar
// -----------------------------------------------------------------

i32 TimeSystem::days_in_month(i32 year, i32 month)
{
    using namespace std::chrono;

    const year_month current{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}};
    const year_month next = current + months{1};

    const sys_days first_of_current{current / 1};
    const sys_days first_of_next{next / 1};

    return static_cast<i32>((first_of_next - first_of_current).count());
}

bool TimeSystem::is_valid_date(i32 year, i32 month, i32 day)
{
    if (month < 1 || month > 12 || day < 1)
    {
        return false;
    }
    return day <= days_in_month(year, month);
}

// -----------------------------------------------------------------
// Formatting
// -----------------------------------------------------------------

std::string TimeSystem::format_date(const DateTime& dt)
{
    return fmt::format("{:04}-{:02}-{:02}", dt.year, dt.month, dt.day);
}

std::string TimeSystem::format_time(const DateTime& dt)
{
    return fmt::format("{:02}:{:02}:{:02}",
                       dt.hour, dt.minute, static_cast<i32>(std::floor(dt.second)));
}

std::string TimeSystem::format_date_time(const DateTime& dt)
{
    return format_date(dt) + " " + format_time(dt);
}

std::string TimeSystem::now_local_iso()
{
    const std::time_t now = std::time(nullptr);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", local);
}

} // namespace gochara::astro
