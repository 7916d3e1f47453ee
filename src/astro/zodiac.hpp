#pragma once

/// @file zodiac.hpp
/// @brief Sidereal zodiac classification of ecliptic longitudes.

#include "core/types.hpp"

#include <array>
#include <string>
#include <string_view>

namespace gochara::astro
{
    /// @brief Placement of a longitude inside the twelve 30° signs.
    struct ZodiacPlacement
    {
        i32 sign_index;              ///< 0 = Aries … 11 = Pisces
        f64 degree_in_sign;          ///< Residual arc within the sign, [0, 30)
        std::string degree_formatted;  ///< D°MM'SS" with truncated minutes and seconds
    };

    /// @brief Whole degrees, arc-minutes and arc-seconds of an arc (all truncated).
    struct Dms
    {
        i32 degrees;
        i32 minutes;
        i32 seconds;
    };

    /// @brief Static utility class for zodiac sign lookups and DMS formatting.
    class Zodiac
    {
    public:
        Zodiac() = delete;

        static constexpr i32 kSignCount = 12;

        /// @brief Classify an ecliptic longitude (degrees).
        ///
        /// The longitude is first reduced into [0, 360); the sign index is
        /// floor(λ / 30), so 30.0 belongs to Taurus.
        [[nodiscard]] static ZodiacPlacement classify(f64 longitude_deg);

        /// @brief Reduce an angle in degrees into [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 angle_deg);

        /// @brief Split an arc into truncated degrees, minutes and seconds.
        [[nodiscard]] static Dms to_dms(f64 arc_deg);

        /// @brief Format an arc as D°MM'SS".
        [[nodiscard]] static std::string format_dms(f64 arc_deg);

        /// @brief English sign name ("Aries" … "Pisces").
        [[nodiscard]] static std::string_view sign_name(i32 sign_index);

        /// @brief Vietnamese sign name ("Bạch Dương" … "Song Ngư").
        [[nodiscard]] static std::string_view sign_name_vi(i32 sign_index);

    private:
        static const std::array<std::string_view, kSignCount> kSignNames;
        static const std::array<std::string_view, kSignCount> kSignNamesVi;
    };

} // namespace gochara::astro
