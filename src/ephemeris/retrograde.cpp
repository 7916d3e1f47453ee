/// @file retrograde.cpp
/// @brief Retrograde detector implementation.

#include "ephemeris/retrograde.hpp"

#include "core/logger.hpp"

namespace gochara::ephemeris
{

std::string_view to_string(RetrogradeMethod method)
{
    switch (method)
    {
        case RetrogradeMethod::Speed:            return "speed";
        case RetrogradeMethod::FiniteDifference: return "finite-difference";
    }
    return "speed";
}

std::optional<RetrogradeMethod> retrograde_method_from_string(std::string_view text)
{
    if (text == "speed")
    {
        return RetrogradeMethod::Speed;
    }
    if (text == "finite-difference" || text == "diff")
    {
        return RetrogradeMethod::FiniteDifference;
    }
    return std::nullopt;
}

RetrogradeDetector::RetrogradeDetector(EphemerisEngine& engine, RetrogradeMethod method)
    : m_engine{engine}
    , m_method{method}
{
}

bool RetrogradeDetector::is_retrograde(PlanetId planet, f64 jd_ut,
                                       const EclipticPosition& current) const
{
    if (m_method == RetrogradeMethod::Speed)
    {
        return from_speed(current.longitude_speed());
    }

    // -----------------------------------------------------------------
    // One-day finite difference
    // -----------------------------------------------------------------
    const CalcResult next = m_engine.calculate(jd_ut + 1.0, planet);
    if (!next.ok())
    {
        GCH_CORE_TRACE("Retrograde probe for {} at JD {} failed, assuming direct",
                       Planets::name(planet), jd_ut + 1.0);
        return false;
    }

    const f64 delta = wrap_delta(next.position->longitude() - current.longitude());
    return delta < 0.0;
}

bool RetrogradeDetector::from_speed(f64 longitude_speed)
{
    return longitude_speed < 0.0;
}

f64 RetrogradeDetector::wrap_delta(f64 delta_deg)
{
    if (delta_deg > astro_constants::kHalfCircleDeg)
    {
        delta_deg -= astro_constants::kFullCircleDeg;
    }
    else if (delta_deg <= -astro_constants::kHalfCircleDeg)
    {
        delta_deg += astro_constants::kFullCircleDeg;
    }
    return delta_deg;
}

} // namespace gochara::ephemeris
