#pragma once

/// @file planet.hpp
/// @brief Planet identities, canonical order and display strings.

#include "core/types.hpp"

#include <array>
#include <cstddef>
#include <string_view>

namespace gochara::ephemeris
{
    /// @brief Bodies tracked by the transit tables, in canonical order.
    ///
    /// Rahu is the mean lunar north node. Ketu (south node) is never
    /// computed by an ephemeris engine; it is derived from Rahu.
    enum class PlanetId : u8
    {
        Sun,
        Moon,
        Mercury,
        Venus,
        Mars,
        Jupiter,
        Saturn,
        Uranus,
        Neptune,
        Pluto,
        Rahu,
        Ketu,
    };

    /// @brief Static display data for one planet.
    struct PlanetInfo
    {
        PlanetId id;
        std::string_view name;     ///< English name, also the table column prefix
        std::string_view symbol;   ///< Astronomical symbol (UTF-8)
        std::string_view name_vi;  ///< Vietnamese display name
    };

    /// @brief Lookup tables for PlanetId.
    class Planets
    {
    public:
        Planets() = delete;

        static constexpr std::size_t kCount = 12;
        static constexpr std::size_t kComputedCount = 11;

        /// @brief All planets in canonical order (Sun … Rahu, Ketu).
        [[nodiscard]] static const std::array<PlanetId, kCount>& all();

        /// @brief Planets requested from the ephemeris engine (everything but Ketu).
        [[nodiscard]] static const std::array<PlanetId, kComputedCount>& computed();

        [[nodiscard]] static const PlanetInfo& info(PlanetId id);
        [[nodiscard]] static std::string_view name(PlanetId id);
    };

} // namespace gochara::ephemeris
