#pragma once

/// @file time_system.hpp
/// @brief Civil time utilities: fixed UTC offsets, Julian Day (UT), month calendar.

#include "core/types.hpp"

#include <string>

namespace gochara::astro
{
    /// @brief Civil date/time representation (zone given separately).
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for civil ↔ Julian Day conversions.
    ///
    /// Julian Day conversion follows Meeus (Astronomical Algorithms, Ch. 7)
    /// with the Gregorian calendar. UTC offsets are plain numbers of hours;
    /// no timezone database is consulted.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UT) to Julian Day.
        /// @param dt Civil date/time. Month in [1,12], day in [1,31].
        /// @return Julian Day as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Day back to civil date/time (UT).
        /// @param jd Julian Day (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Shift a local civil time to UT by subtracting the UTC offset.
        ///
        /// Carries across day, month and year boundaries. The offset is rounded
        /// to whole seconds; the fractional part of @p local.second is kept.
        ///
        /// @param local Civil date/time at the given offset.
        /// @param utc_offset_hours Signed offset, e.g. +7.0 or -3.5.
        [[nodiscard]] static DateTime to_universal(const DateTime& local, f64 utc_offset_hours);

        /// @brief Julian Day (UT) of a local civil time at a fixed UTC offset.
        [[nodiscard]] static f64 julian_day_ut(const DateTime& local, f64 utc_offset_hours);

        /// @brief Number of days in a month, as next month's first day minus this month's.
        [[nodiscard]] static i32 days_in_month(i32 year, i32 month);

        /// @brief True if (year, month, day) names a real Gregorian calendar day.
        [[nodiscard]] static bool is_valid_date(i32 year, i32 month, i32 day);

        /// @brief "YYYY-MM-DD"
        [[nodiscard]] static std::string format_date(const DateTime& dt);

        /// @brief "HH:MM:SS" (seconds truncated)
        [[nodiscard]] static std::string format_time(const DateTime& dt);

        /// @brief "YYYY-MM-DD HH:MM:SS"
        [[nodiscard]] static std::string format_date_time(const DateTime& dt);

        /// @brief Current wall-clock time in the system zone, "YYYY-MM-DDTHH:MM:SS".
        [[nodiscard]] static std::string now_local_iso();
    };

} // namespace gochara::astro
