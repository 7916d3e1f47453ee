/// @file zodiac.cpp
/// @brief Implementation of zodiac classification and DMS formatting.

#include "astro/zodiac.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>

namespace gochara::astro
{

const std::array<std::string_view, Zodiac::kSignCount> Zodiac::kSignNames = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

const std::array<std::string_view, Zodiac::kSignCount> Zodiac::kSignNamesVi = {
    "Bạch Dương", "Kim Ngưu", "Song Tử", "Cự Giải", "Sư Tử", "Xử Nữ",
    "Thiên Bình", "Thần Nông", "Nhân Mã", "Ma Kết", "Bảo Bình", "Song Ngư",
};

// -----------------------------------------------------------------
// Longitude → sign index + residual arc
// -----------------------------------------------------------------

ZodiacPlacement Zodiac::classify(f64 longitude_deg)
{
    const f64 lon = normalize_degrees(longitude_deg);

    i32 sign_index = static_cast<i32>(std::floor(lon / astro_constants::kSignSpanDeg));
    f64 degree_in_sign = std::fmod(lon, astro_constants::kSignSpanDeg);

    // floor(λ/30) and fmod(λ, 30) can disagree by one ulp just below a cusp
    if (degree_in_sign >= astro_constants::kSignSpanDeg)
    {
        degree_in_sign = 0.0;
    }
    if (sign_index >= kSignCount)
    {
        sign_index = kSignCount - 1;
    }

    return ZodiacPlacement{
        .sign_index       = sign_index,
        .degree_in_sign   = degree_in_sign,
        .degree_formatted = format_dms(degree_in_sign),
    };
}

f64 Zodiac::normalize_degrees(f64 angle_deg)
{
    f64 angle = std::fmod(angle_deg, astro_constants::kFullCircleDeg);
    if (angle < 0.0)
    {
        angle += astro_constants::kFullCircleDeg;
    }
    // -1e-17 + 360 rounds to exactly 360
    if (angle >= astro_constants::kFullCircleDeg)
    {
        angle = 0.0;
    }
    return angle;
}

// -----------------------------------------------------------------
// Degrees → D°MM'SS" (successive truncation)
// -----------------------------------------------------------------

Dms Zodiac::to_dms(f64 arc_deg)
{
    const f64 d = std::floor(arc_deg);
    const f64 minutes_full = (arc_deg - d) * 60.0;
    const f64 m = std::floor(minutes_full);
    const f64 s = std::floor((minutes_full - m) * 60.0);

    return Dms{
        .degrees = static_cast<i32>(d),
        .minutes = static_cast<i32>(m),
        .seconds = static_cast<i32>(s),
    };
}

std::string Zodiac::format_dms(f64 arc_deg)
{
    const Dms dms = to_dms(arc_deg);
    return fmt::format("{}°{:02}'{:02}\"", dms.degrees, dms.minutes, dms.seconds);
}

std::string_view Zodiac::sign_name(i32 sign_index)
{
    return kSignNames.at(static_cast<std::size_t>(sign_index));
}

std::string_view Zodiac::sign_name_vi(i32 sign_index)
{
    return kSignNamesVi.at(static_cast<std::size_t>(sign_index));
}

} // namespace gochara::astro
