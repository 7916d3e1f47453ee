/// @file monthly_driver.cpp
/// @brief Monthly sampling loop.

#include "transit/monthly_driver.hpp"

#include "core/logger.hpp"

namespace gochara::transit
{

namespace
{

constexpr i32 kMinutesPerDay = 24 * 60;

} // anonymous namespace

MonthlyDriver::MonthlyDriver(ephemeris::EphemerisEngine& engine, const RunParameters& params)
    : m_params{params}
    , m_builder{engine, params.retrograde_method}
    , m_aspects{params.orb_deg}
{
}

std::size_t MonthlyDriver::sample_count() const
{
    const i32 days = astro::TimeSystem::days_in_month(m_params.year, m_params.month);
    const i32 per_day = (kMinutesPerDay + m_params.step_minutes - 1) / m_params.step_minutes;
    return static_cast<std::size_t>(days) * static_cast<std::size_t>(per_day);
}

std::optional<MonthlyResult> MonthlyDriver::run() const
{
    const i32 days = astro::TimeSystem::days_in_month(m_params.year, m_params.month);
    const std::size_t total = sample_count();

    GCH_INFO("Computing {:02}/{} (UTC{:+}) on a {}-minute grid: {} days, {} samples",
             m_params.month, m_params.year, m_params.utc_offset_hours,
             m_params.step_minutes, days, total);

    MonthlyResult result{.parameters = m_params, .samples = {}, .aspects = {}, .ingresses = {}};
    result.samples.reserve(total);

    for (i32 day = 1; day <= days; ++day)
    {
        for (i32 minute_of_day = 0; minute_of_day < kMinutesPerDay; minute_of_day += m_params.step_minutes)
        {
            const astro::DateTime local{
                .year   = m_params.year,
                .month  = m_params.month,
                .day    = day,
                .hour   = minute_of_day / 60,
                .minute = minute_of_day % 60,
                .second = 0.0,
            };
            const astro::DateTime universal = astro::TimeSystem::to_universal(local, m_params.utc_offset_hours);
            const f64 jd = astro::TimeSystem::to_julian_date(universal);

            auto snapshot = m_builder.build(jd);
            if (!snapshot)
            {
                GCH_ERROR("Run aborted at {} (JD {:.6f})",
                          astro::TimeSystem::format_date_time(local), jd);
                return std::nullopt;
            }

            // -----------------------------------------------------------------
            // Events against the previous sample
            // -----------------------------------------------------------------
            const ephemeris::Snapshot* previous =
                result.samples.empty() ? nullptr : &result.samples.back().snapshot;

            const std::string stamp = astro::TimeSystem::format_date_time(local);

            for (events::AspectEvent& aspect : m_aspects.detect(*snapshot))
            {
                aspect.datetime = stamp;
                result.aspects.push_back(std::move(aspect));
            }

            for (events::IngressEvent& ingress : events::IngressDetector::detect(*snapshot, previous))
            {
                ingress.datetime = stamp;
                GCH_DEBUG("{} {}: {} -> {}", stamp, ephemeris::Planets::name(ingress.planet),
                          astro::Zodiac::sign_name(ingress.from_sign_index),
                          astro::Zodiac::sign_name(ingress.to_sign_index));
                result.ingresses.push_back(std::move(ingress));
            }

            result.samples.push_back(SampleRecord{
                .local       = local,
                .universal   = universal,
                .julian_day  = jd,
                .snapshot    = std::move(*snapshot),
            });
        }

        const f64 progress = 100.0 * static_cast<f64>(result.samples.size()) / static_cast<f64>(total);
        GCH_INFO("Progress: {:.1f}% - day {}/{}", progress, day, days);
    }

    GCH_INFO("Done: {} records, {} aspects, {} ingresses",
             result.samples.size(), result.aspects.size(), result.ingresses.size());

    return result;
}

} // namespace gochara::transit
