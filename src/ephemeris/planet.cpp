/// @file planet.cpp
/// @brief Planet display tables.

#include "ephemeris/planet.hpp"

namespace gochara::ephemeris
{

namespace
{

constexpr std::array<PlanetInfo, Planets::kCount> kPlanetTable = {{
    {PlanetId::Sun,     "Sun",     "☉", "Mặt Trời"},
    {PlanetId::Moon,    "Moon",    "☽", "Mặt Trăng"},
    {PlanetId::Mercury, "Mercury", "☿", "Sao Thủy"},
    {PlanetId::Venus,   "Venus",   "♀", "Sao Kim"},
    {PlanetId::Mars,    "Mars",    "♂", "Sao Hỏa"},
    {PlanetId::Jupiter, "Jupiter", "♃", "Sao Mộc"},
    {PlanetId::Saturn,  "Saturn",  "♄", "Sao Thổ"},
    {PlanetId::Uranus,  "Uranus",  "♅", "Sao Thiên Vương"},
    {PlanetId::Neptune, "Neptune", "♆", "Sao Hải Vương"},
    {PlanetId::Pluto,   "Pluto",   "♇", "Sao Diêm Vương"},
    {PlanetId::Rahu,    "Rahu",    "☊", "Rahu (Bắc Giao Điểm)"},
    {PlanetId::Ketu,    "Ketu",    "☋", "Ketu (Nam Giao Điểm)"},
}};

constexpr std::array<PlanetId, Planets::kCount> kAllPlanets = {
    PlanetId::Sun, PlanetId::Moon, PlanetId::Mercury, PlanetId::Venus,
    PlanetId::Mars, PlanetId::Jupiter, PlanetId::Saturn, PlanetId::Uranus,
    PlanetId::Neptune, PlanetId::Pluto, PlanetId::Rahu, PlanetId::Ketu,
};

constexpr std::array<PlanetId, Planets::kComputedCount> kComputedPlanets = {
    PlanetId::Sun, PlanetId::Moon, PlanetId::Mercury, PlanetId::Venus,
    PlanetId::Mars, PlanetId::Jupiter, PlanetId::Saturn, PlanetId::Uranus,
    PlanetId::Neptune, PlanetId::Pluto, PlanetId::Rahu,
};

} // anonymous namespace

const std::array<PlanetId, Planets::kCount>& Planets::all()
{
    return kAllPlanets;
}

const std::array<PlanetId, Planets::kComputedCount>& Planets::computed()
{
    return kComputedPlanets;
}

const PlanetInfo& Planets::info(PlanetId id)
{
    return kPlanetTable.at(static_cast<std::size_t>(id));
}

std::string_view Planets::name(PlanetId id)
{
    return info(id).name;
}

} // namespace gochara::ephemeris
