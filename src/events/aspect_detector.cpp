/// @file aspect_detector.cpp
/// @brief Aspect detection over all planet pairs of a snapshot.

#include "events/aspect_detector.hpp"

#include <cmath>

namespace gochara::events
{

namespace
{

constexpr std::array<AspectDefinition, 5> kAspectTable = {{
    {AspectType::Conjunction, "Conjunction", 0},
    {AspectType::Opposition,  "Opposition",  180},
    {AspectType::Square,      "Square",      90},
    {AspectType::Trine,       "Trine",       120},
    {AspectType::Sextile,     "Sextile",     60},
}};

bool is_node_pair(ephemeris::PlanetId a, ephemeris::PlanetId b)
{
    using ephemeris::PlanetId;
    return (a == PlanetId::Rahu && b == PlanetId::Ketu)
        || (a == PlanetId::Ketu && b == PlanetId::Rahu);
}

} // anonymous namespace

AspectDetector::AspectDetector(f64 orb_deg)
    : m_orb_deg{orb_deg}
{
}

std::vector<AspectEvent> AspectDetector::detect(const ephemeris::Snapshot& snapshot) const
{
    std::vector<AspectEvent> aspects;
    const auto& positions = snapshot.positions();

    for (std::size_t i = 0; i < positions.size(); ++i)
    {
        for (std::size_t j = i + 1; j < positions.size(); ++j)
        {
            const ephemeris::PlanetPosition& p1 = positions[i];
            const ephemeris::PlanetPosition& p2 = positions[j];

            if (is_node_pair(p1.planet, p2.planet))
            {
                continue;
            }

            const f64 diff = separation(p1.longitude(), p2.longitude());

            for (const AspectDefinition& aspect : kAspectTable)
            {
                const f64 residual = std::abs(diff - static_cast<f64>(aspect.angle_deg));
                if (residual > m_orb_deg)
                {
                    continue;
                }

                aspects.push_back(AspectEvent{
                    .type               = aspect.type,
                    .planet1            = p1.planet,
                    .planet1_sign_index = p1.zodiac.sign_index,
                    .planet1_degree     = p1.zodiac.degree_formatted,
                    .planet2            = p2.planet,
                    .planet2_sign_index = p2.zodiac.sign_index,
                    .planet2_degree     = p2.zodiac.degree_formatted,
                    .exact_angle        = aspect.angle_deg,
                    .difference         = diff,
                    .orb_residual       = residual,
                    .datetime           = {},
                });
            }
        }
    }

    return aspects;
}

// -----------------------------------------------------------------
// Shortest arc: |λ1 − λ2| mod 360, reflected above 180
// -----------------------------------------------------------------

f64 AspectDetector::separation(f64 longitude1_deg, f64 longitude2_deg)
{
    f64 diff = std::fmod(std::abs(longitude1_deg - longitude2_deg), astro_constants::kFullCircleDeg);
    if (diff > astro_constants::kHalfCircleDeg)
    {
        diff = astro_constants::kFullCircleDeg - diff;
    }
    return diff;
}

const std::array<AspectDefinition, 5>& AspectDetector::table()
{
    return kAspectTable;
}

std::string_view AspectDetector::name(AspectType type)
{
    return kAspectTable.at(static_cast<std::size_t>(type)).name;
}

} // namespace gochara::events
