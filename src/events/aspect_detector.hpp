#pragma once

/// @file aspect_detector.hpp
/// @brief Angular aspects between pairs of planets in one snapshot.

#include "core/types.hpp"
#include "ephemeris/planet.hpp"
#include "ephemeris/snapshot.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace gochara::events
{
    enum class AspectType : u8
    {
        Conjunction,
        Opposition,
        Square,
        Trine,
        Sextile,
    };

    /// @brief Entry of the fixed aspect table.
    struct AspectDefinition
    {
        AspectType type;
        std::string_view name;
        i32 angle_deg;
    };

    /// @brief An aspect found between two planets at one instant.
    struct AspectEvent
    {
        AspectType type;
        ephemeris::PlanetId planet1;   ///< Earlier in canonical order
        i32 planet1_sign_index;
        std::string planet1_degree;
        ephemeris::PlanetId planet2;
        i32 planet2_sign_index;
        std::string planet2_degree;
        i32 exact_angle;
        f64 difference;      ///< Shortest arc between the two longitudes, [0, 180]
        f64 orb_residual;    ///< |difference − exact_angle|
        std::string datetime;  ///< Local sample time, stamped by the driver
    };

    /// @brief Scans a snapshot for Conjunction, Opposition, Square, Trine and Sextile.
    ///
    /// Pairs are visited in canonical order (i < j); within a pair, aspects
    /// follow the table order. The Rahu–Ketu pair is skipped because its
    /// opposition is structural.
    class AspectDetector
    {
    public:
        static constexpr f64 kDefaultOrbDeg = 1.0;

        explicit AspectDetector(f64 orb_deg = kDefaultOrbDeg);

        [[nodiscard]] std::vector<AspectEvent> detect(const ephemeris::Snapshot& snapshot) const;

        [[nodiscard]] f64 orb() const { return m_orb_deg; }

        /// @brief Shortest arc between two longitudes, in [0, 180].
        [[nodiscard]] static f64 separation(f64 longitude1_deg, f64 longitude2_deg);

        [[nodiscard]] static const std::array<AspectDefinition, 5>& table();
        [[nodiscard]] static std::string_view name(AspectType type);

    private:
        f64 m_orb_deg;
    };

} // namespace gochara::events
