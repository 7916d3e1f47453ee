/// @file swiss_ephemeris.cpp
/// @brief Swiss Ephemeris adapter implementation.

#include "ephemeris/swiss_ephemeris.hpp"

#include "core/logger.hpp"

extern "C" {
#include "swephexp.h"
}

#include <array>
#include <system_error>

namespace gochara::ephemeris
{

SwissEphemeris::SwissEphemeris(std::filesystem::path data_path)
    : m_data_path{std::move(data_path)}
{
    // -----------------------------------------------------------------
    // One-shot library configuration
    // -----------------------------------------------------------------
    if (m_data_path.empty())
    {
        swe_set_ephe_path(nullptr);
    }
    else
    {
        std::string path = m_data_path.string();
        swe_set_ephe_path(path.data());
    }

    // Lahiri ayanamsa, no user-defined reference epoch
    swe_set_sid_mode(SE_SIDM_LAHIRI, 0.0, 0.0);

    GCH_CORE_INFO("Swiss Ephemeris {} configured (path: \"{}\", sidereal: Lahiri, node: mean)",
                  version(),
                  m_data_path.empty() ? std::string{"<default>"} : m_data_path.string());
}

SwissEphemeris::~SwissEphemeris()
{
    swe_close();
}

CalcResult SwissEphemeris::calculate(f64 jd_ut, PlanetId planet)
{
    // -----------------------------------------------------------------
    // Data directory check (first calculation only)
    // -----------------------------------------------------------------
    if (!m_data_path_ok.has_value())
    {
        std::error_code ec;
        m_data_path_ok = m_data_path.empty() || std::filesystem::is_directory(m_data_path, ec);
    }

    if (!*m_data_path_ok)
    {
        return CalcResult::failure(CalcError::DataPathMissing,
            "ephemeris data directory not found: " + m_data_path.string());
    }

    const auto body = body_number(planet);
    if (!body)
    {
        return CalcResult::failure(CalcError::UnsupportedBody,
            std::string{Planets::name(planet)} + " is not computed by the Swiss Ephemeris adapter");
    }

    // -----------------------------------------------------------------
    // swe_calc_ut: xx = lon, lat, dist, lon speed, lat speed, dist speed
    // -----------------------------------------------------------------
    constexpr int32 kFlags = SEFLG_SWIEPH | SEFLG_SIDEREAL | SEFLG_SPEED;

    std::array<double, 6> xx{};
    std::array<char, AS_MAXCH> serr{};

    const int32 ret = swe_calc_ut(jd_ut, *body, kFlags, xx.data(), serr.data());
    if (ret < 0)
    {
        return CalcResult::failure(CalcError::EngineFailure, std::string{serr.data()});
    }

    if (serr[0] != '\0')
    {
        GCH_CORE_DEBUG("swe_calc_ut({}, {}): {}", jd_ut, Planets::name(planet), serr.data());
    }

    return CalcResult::success(EclipticPosition{
        .position = Vec3d{xx[0], xx[1], xx[2]},
        .velocity = Vec3d{xx[3], xx[4], xx[5]},
    });
}

std::string SwissEphemeris::description() const
{
    return "Swiss Ephemeris";
}

std::string SwissEphemeris::version()
{
    std::array<char, AS_MAXCH> buffer{};
    swe_version(buffer.data());
    return std::string{buffer.data()};
}

std::optional<i32> SwissEphemeris::body_number(PlanetId planet)
{
    switch (planet)
    {
        case PlanetId::Sun:     return SE_SUN;
        case PlanetId::Moon:    return SE_MOON;
        case PlanetId::Mercury: return SE_MERCURY;
        case PlanetId::Venus:   return SE_VENUS;
        case PlanetId::Mars:    return SE_MARS;
        case PlanetId::Jupiter: return SE_JUPITER;
        case PlanetId::Saturn:  return SE_SATURN;
        case PlanetId::Uranus:  return SE_URANUS;
        case PlanetId::Neptune: return SE_NEPTUNE;
        case PlanetId::Pluto:   return SE_PLUTO;
        case PlanetId::Rahu:    return SE_MEAN_NODE;
        case PlanetId::Ketu:    return std::nullopt;
    }
    return std::nullopt;
}

} // namespace gochara::ephemeris
