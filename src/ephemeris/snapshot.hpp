#pragma once

/// @file snapshot.hpp
/// @brief Positions of all planets at one sample instant.

#include "astro/zodiac.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_engine.hpp"
#include "ephemeris/planet.hpp"
#include "ephemeris/retrograde.hpp"

#include <optional>
#include <vector>

namespace gochara::ephemeris
{
    /// @brief One planet's record inside a Snapshot.
    struct PlanetPosition
    {
        PlanetId planet;
        EclipticPosition ecliptic;
        astro::ZodiacPlacement zodiac;
        bool retrograde;
        char motion;  ///< 'R' retrograde, 'D' direct

        [[nodiscard]] f64 longitude() const { return ecliptic.longitude(); }
        [[nodiscard]] const PlanetInfo& info() const { return Planets::info(planet); }
    };

    /// @brief Planet records for one instant, kept in canonical planet order.
    ///
    /// Planets whose calculation failed are simply absent.
    class Snapshot
    {
    public:
        Snapshot() = default;

        /// @brief Insert or replace a planet record, keeping canonical order.
        void add(PlanetPosition position);

        /// @brief Record for @p planet, or nullptr if it is absent.
        [[nodiscard]] const PlanetPosition* find(PlanetId planet) const;

        [[nodiscard]] bool contains(PlanetId planet) const { return find(planet) != nullptr; }
        [[nodiscard]] const std::vector<PlanetPosition>& positions() const { return m_positions; }
        [[nodiscard]] std::size_t size() const { return m_positions.size(); }
        [[nodiscard]] bool empty() const { return m_positions.empty(); }

    private:
        std::vector<PlanetPosition> m_positions;
    };

    /// @brief Composes a Snapshot from engine calculations.
    class SnapshotBuilder
    {
    public:
        SnapshotBuilder(EphemerisEngine& engine, RetrogradeMethod method);

        /// @brief Compute every planet at @p jd_ut and derive Ketu from Rahu.
        ///
        /// Per-planet failures are logged and the planet is omitted.
        /// @return The snapshot, or std::nullopt on a fatal engine failure.
        [[nodiscard]] std::optional<Snapshot> build(f64 jd_ut) const;

        /// @brief Classify an engine result into a snapshot record.
        [[nodiscard]] static PlanetPosition make_position(PlanetId planet,
                                                          const EclipticPosition& ecliptic,
                                                          bool retrograde);

        /// @brief South node opposite the given north-node record.
        ///
        /// Longitude (λ + 180) mod 360, latitude and its speed negated,
        /// longitude speed negated, distance and distance speed copied,
        /// retrograde flag and motion letter mirrored.
        [[nodiscard]] static PlanetPosition derive_ketu(const PlanetPosition& rahu);

    private:
        EphemerisEngine& m_engine;
        RetrogradeDetector m_retrograde;
    };

} // namespace gochara::ephemeris
