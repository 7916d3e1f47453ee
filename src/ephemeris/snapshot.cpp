/// @file snapshot.cpp
/// @brief Snapshot composition, including the derived south node.

#include "ephemeris/snapshot.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace gochara::ephemeris
{

// -----------------------------------------------------------------
// Snapshot
// -----------------------------------------------------------------

void Snapshot::add(PlanetPosition position)
{
    const auto it = std::lower_bound(
        m_positions.begin(), m_positions.end(), position.planet,
        [](const PlanetPosition& p, PlanetId id) { return p.planet < id; });

    if (it != m_positions.end() && it->planet == position.planet)
    {
        *it = std::move(position);
        return;
    }
    m_positions.insert(it, std::move(position));
}

const PlanetPosition* Snapshot::find(PlanetId planet) const
{
    const auto it = std::find_if(m_positions.begin(), m_positions.end(),
                                 [planet](const PlanetPosition& p) { return p.planet == planet; });
    return it != m_positions.end() ? &*it : nullptr;
}

// -----------------------------------------------------------------
// SnapshotBuilder
// -----------------------------------------------------------------

SnapshotBuilder::SnapshotBuilder(EphemerisEngine& engine, RetrogradeMethod method)
    : m_engine{engine}
    , m_retrograde{engine, method}
{
}

std::optional<Snapshot> SnapshotBuilder::build(f64 jd_ut) const
{
    Snapshot snapshot;

    for (const PlanetId planet : Planets::computed())
    {
        const CalcResult result = m_engine.calculate(jd_ut, planet);

        if (result.is_fatal())
        {
            GCH_CORE_CRITICAL("Ephemeris misconfigured: {}", result.message);
            return std::nullopt;
        }

        if (!result.ok())
        {
            GCH_CORE_WARN("Calculation failed for {} at JD {:.6f}: {}",
                          Planets::name(planet), jd_ut, result.message);
            continue;
        }

        const bool retrograde = m_retrograde.is_retrograde(planet, jd_ut, *result.position);
        snapshot.add(make_position(planet, *result.position, retrograde));
    }

    // Ketu exists only alongside Rahu
    if (const PlanetPosition* rahu = snapshot.find(PlanetId::Rahu))
    {
        snapshot.add(derive_ketu(*rahu));
    }

    return snapshot;
}

PlanetPosition SnapshotBuilder::make_position(PlanetId planet,
                                              const EclipticPosition& ecliptic,
                                              bool retrograde)
{
    return PlanetPosition{
        .planet     = planet,
        .ecliptic   = ecliptic,
        .zodiac     = astro::Zodiac::classify(ecliptic.longitude()),
        .retrograde = retrograde,
        .motion     = retrograde ? 'R' : 'D',
    };
}

PlanetPosition SnapshotBuilder::derive_ketu(const PlanetPosition& rahu)
{
    const EclipticPosition& north = rahu.ecliptic;

    const f64 ketu_longitude = std::fmod(north.longitude() + astro_constants::kHalfCircleDeg,
                                         astro_constants::kFullCircleDeg);

    const EclipticPosition south{
        .position = Vec3d{ketu_longitude, -north.latitude(), north.distance()},
        .velocity = Vec3d{-north.longitude_speed(), -north.latitude_speed(), north.distance_speed()},
    };

    return PlanetPosition{
        .planet     = PlanetId::Ketu,
        .ecliptic   = south,
        .zodiac     = astro::Zodiac::classify(ketu_longitude),
        .retrograde = rahu.retrograde,
        .motion     = rahu.motion,
    };
}

} // namespace gochara::ephemeris
