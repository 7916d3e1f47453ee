/// @file records.cpp
/// @brief Export row construction.

#include "io/records.hpp"

#include "astro/time_system.hpp"
#include "astro/zodiac.hpp"
#include "ephemeris/planet.hpp"

#include <spdlog/fmt/fmt.h>

#include <charconv>
#include <cmath>
#include <string>

namespace gochara::io
{

namespace
{

constexpr i32 kPositionDigits = 6;
constexpr i32 kAspectDigits = 4;

} // anonymous namespace

Record Records::snapshot_record(const transit::SampleRecord& sample, f64 utc_offset_hours)
{
    Record record;
    record["date"]            = astro::TimeSystem::format_date(sample.local);
    record["time"]            = astro::TimeSystem::format_time(sample.local);
    record["datetime_local"]  = astro::TimeSystem::format_date_time(sample.local);
    record["datetime_utc"]    = astro::TimeSystem::format_date_time(sample.universal);
    record["julian_day"]      = sample.julian_day;
    record["timezone_offset"] = utc_offset_hours;

    // Positions are already in canonical order (Ketu last)
    for (const ephemeris::PlanetPosition& pos : sample.snapshot.positions())
    {
        const ephemeris::PlanetInfo& info = pos.info();
        const std::string prefix{info.name};

        record[prefix + "_Longitude"]      = round_to(pos.ecliptic.longitude(), kPositionDigits);
        record[prefix + "_Latitude"]       = round_to(pos.ecliptic.latitude(), kPositionDigits);
        record[prefix + "_Distance"]       = round_to(pos.ecliptic.distance(), kPositionDigits);
        record[prefix + "_Sign"]           = std::string{astro::Zodiac::sign_name(pos.zodiac.sign_index)};
        record[prefix + "_Sign_VI"]        = std::string{astro::Zodiac::sign_name_vi(pos.zodiac.sign_index)};
        record[prefix + "_Degree"]         = pos.zodiac.degree_formatted;
        record[prefix + "_Degree_Decimal"] = round_to(pos.zodiac.degree_in_sign, kPositionDigits);
        record[prefix + "_Motion"]         = std::string(1, pos.motion);
        record[prefix + "_Retrograde"]     = pos.retrograde;
        record[prefix + "_Speed"]          = round_to(pos.ecliptic.longitude_speed(), kPositionDigits);
        record[prefix + "_Symbol"]         = std::string{info.symbol};
        record[prefix + "_Name_VI"]        = std::string{info.name_vi};
    }

    return record;
}

Record Records::aspect_record(const events::AspectEvent& aspect)
{
    Record record;
    record["datetime"]       = aspect.datetime;
    record["event"]          = "Aspect";
    record["type"]           = std::string{events::AspectDetector::name(aspect.type)};
    record["planet1"]        = std::string{ephemeris::Planets::name(aspect.planet1)};
    record["planet1_sign"]   = std::string{astro::Zodiac::sign_name(aspect.planet1_sign_index)};
    record["planet1_degree"] = aspect.planet1_degree;
    record["planet2"]        = std::string{ephemeris::Planets::name(aspect.planet2)};
    record["planet2_sign"]   = std::string{astro::Zodiac::sign_name(aspect.planet2_sign_index)};
    record["planet2_degree"] = aspect.planet2_degree;
    record["exact_angle"]    = aspect.exact_angle;
    record["difference"]     = round_to(aspect.difference, kAspectDigits);
    record["orb"]            = round_to(aspect.orb_residual, kAspectDigits);
    return record;
}

Record Records::ingress_record(const events::IngressEvent& ingress)
{
    Record record;
    record["datetime"]  = ingress.datetime;
    record["event"]     = "Ingress";
    record["planet"]    = std::string{ephemeris::Planets::name(ingress.planet)};
    record["from_sign"] = std::string{astro::Zodiac::sign_name(ingress.from_sign_index)};
    record["to_sign"]   = std::string{astro::Zodiac::sign_name(ingress.to_sign_index)};
    record["degree"]    = ingress.degree;
    record["longitude"] = round_to(ingress.longitude, kPositionDigits);
    return record;
}

Table Records::snapshot_table(const transit::MonthlyResult& result)
{
    Table table;
    table.reserve(result.samples.size());
    for (const transit::SampleRecord& sample : result.samples)
    {
        table.push_back(snapshot_record(sample, result.parameters.utc_offset_hours));
    }
    return table;
}

Table Records::aspect_table(const std::vector<events::AspectEvent>& aspects)
{
    Table table;
    table.reserve(aspects.size());
    for (const events::AspectEvent& aspect : aspects)
    {
        table.push_back(aspect_record(aspect));
    }
    return table;
}

Table Records::ingress_table(const std::vector<events::IngressEvent>& ingresses)
{
    Table table;
    table.reserve(ingresses.size());
    for (const events::IngressEvent& ingress : ingresses)
    {
        table.push_back(ingress_record(ingress));
    }
    return table;
}

Record Records::run_metadata(const transit::RunParameters& params,
                             std::string_view engine_description,
                             const std::string& calculation_time)
{
    Record metadata;
    metadata["year"]              = params.year;
    metadata["month"]             = params.month;
    metadata["timezone_offset"]   = params.utc_offset_hours;
    metadata["calculation_time"]  = calculation_time;
    metadata["ephemeris_type"]    = std::string{engine_description};
    metadata["coordinate_system"] = "Sidereal Zodiac (Lahiri)";
    metadata["node_type"]         = "Mean Node";
    metadata["description"]       = "Planetary positions sampled every "
                                  + std::to_string(params.step_minutes)
                                  + " minutes, calculated using Swiss Ephemeris";
    metadata["step_minutes"]      = params.step_minutes;
    metadata["orb"]               = params.orb_deg;
    return metadata;
}

f64 Records::round_to(f64 value, i32 digits)
{
    if (!std::isfinite(value))
    {
        return value;
    }

    // Correctly rounded decimal text of the exact binary value
    const std::string text = fmt::format("{:.{}f}", value, digits);

    f64 rounded = value;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), rounded);
    return ec == std::errc{} ? rounded : value;
}

} // namespace gochara::io
