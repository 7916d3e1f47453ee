/// @file test_monthly_driver.cpp
/// @brief Unit tests for gochara::transit::MonthlyDriver against a fake ephemeris.
///
/// Checks grid cardinality, time stamps, stream ordering and the
/// per-planet ingress chain over a full simulated month.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "fake_ephemeris.hpp"
#include "transit/monthly_driver.hpp"

#include <cmath>
#include <map>

using namespace gochara;
using namespace gochara::ephemeris;
using namespace gochara::transit;

int main(int argc, char** argv)
{
    gochara::core::Logger::init(spdlog::level::err);
    const int result = doctest::Context(argc, argv).run();
    gochara::core::Logger::shutdown();
    return result;
}

namespace
{

// 2025-08-31 17:00 UT, the first sample of September 2025 at UTC+7
constexpr f64 kSeptemberStartJd = 2460919.5 - 7.0 / 24.0;

RunParameters september_2025()
{
    return RunParameters{
        .year              = 2025,
        .month             = 9,
        .utc_offset_hours  = 7.0,
        .step_minutes      = 15,
        .orb_deg           = 1.0,
        .retrograde_method = RetrogradeMethod::Speed,
    };
}

test::FakeEphemeris moving_sky()
{
    test::FakeEphemeris engine(kSeptemberStartJd);
    engine.set_quiet_sky();
    engine.set(PlanetId::Sun,     {130.5, 0.9856});
    engine.set(PlanetId::Moon,    {93.0, 13.176});
    engine.set(PlanetId::Mercury, {155.5, -0.9});
    return engine;
}

} // anonymous namespace

// =================================================================
// Grid
// =================================================================

TEST_CASE("September at 15 minutes has 30 x 96 samples")
{
    auto engine = moving_sky();
    const MonthlyDriver driver(engine, september_2025());

    CHECK(driver.sample_count() == 2880);

    const auto result = driver.run();
    REQUIRE(result.has_value());
    CHECK(result->samples.size() == 2880);
}

TEST_CASE("Step parameter changes the cardinality")
{
    auto engine = moving_sky();
    RunParameters params = september_2025();
    params.month = 2;
    params.year = 2024;
    params.step_minutes = 60;

    const auto result = MonthlyDriver(engine, params).run();
    REQUIRE(result.has_value());
    CHECK(result->samples.size() == 29 * 24);
}

TEST_CASE("First sample is local midnight on day 1, converted to UT")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    const SampleRecord& first = result->samples.front();
    CHECK(astro::TimeSystem::format_date_time(first.local) == "2025-09-01 00:00:00");
    CHECK(astro::TimeSystem::format_date_time(first.universal) == "2025-08-31 17:00:00");
    CHECK(first.julian_day == doctest::Approx(kSeptemberStartJd).epsilon(1e-12));

    const SampleRecord& last = result->samples.back();
    CHECK(astro::TimeSystem::format_date_time(last.local) == "2025-09-30 23:45:00");
}

TEST_CASE("Samples are strictly increasing in time")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    for (std::size_t i = 1; i < result->samples.size(); ++i)
    {
        CHECK(result->samples[i].julian_day > result->samples[i - 1].julian_day);
    }
}

// =================================================================
// Event streams
// =================================================================

TEST_CASE("Event streams are stamped and non-decreasing in time")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    CHECK_FALSE(result->aspects.empty());
    CHECK_FALSE(result->ingresses.empty());

    for (std::size_t i = 1; i < result->aspects.size(); ++i)
    {
        CHECK(result->aspects[i - 1].datetime <= result->aspects[i].datetime);
    }
    for (std::size_t i = 1; i < result->ingresses.size(); ++i)
    {
        CHECK(result->ingresses[i - 1].datetime <= result->ingresses[i].datetime);
    }

    // No ingress on the very first sample
    CHECK(result->ingresses.front().datetime != "2025-09-01 00:00:00");
}

TEST_CASE("Per-planet ingress chain is continuous")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    std::map<PlanetId, i32> last_sign;
    std::size_t moon_ingresses = 0;

    for (const events::IngressEvent& e : result->ingresses)
    {
        if (const auto it = last_sign.find(e.planet); it != last_sign.end())
        {
            CHECK(e.from_sign_index == it->second);
        }
        CHECK(e.from_sign_index != e.to_sign_index);
        last_sign[e.planet] = e.to_sign_index;

        if (e.planet == PlanetId::Moon)
        {
            ++moon_ingresses;
        }
    }

    // 30 days × 13.176°/day ≈ 395° ≈ 13 sign changes
    CHECK(moon_ingresses == 13);
}

TEST_CASE("Aspect invariants hold over the month")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    for (const events::AspectEvent& a : result->aspects)
    {
        const bool node_pair = a.planet1 == PlanetId::Rahu && a.planet2 == PlanetId::Ketu;
        CHECK_FALSE(node_pair);
        CHECK(a.planet1 < a.planet2);
        CHECK(a.difference >= 0.0);
        CHECK(a.difference <= 180.0);
        CHECK(std::abs(a.difference - a.exact_angle) <= 1.0);
    }
}

TEST_CASE("Rahu and Ketu stay opposite in every sample")
{
    auto engine = moving_sky();
    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());

    for (const SampleRecord& sample : result->samples)
    {
        const PlanetPosition* rahu = sample.snapshot.find(PlanetId::Rahu);
        const PlanetPosition* ketu = sample.snapshot.find(PlanetId::Ketu);
        REQUIRE(rahu != nullptr);
        REQUIRE(ketu != nullptr);
        CHECK(ketu->longitude() == std::fmod(rahu->longitude() + 180.0, 360.0));
        CHECK(ketu->retrograde == rahu->retrograde);
    }
}

// =================================================================
// Failures
// =================================================================

TEST_CASE("A fatal engine failure aborts the run")
{
    auto engine = moving_sky();
    engine.make_fatal();

    CHECK_FALSE(MonthlyDriver(engine, september_2025()).run().has_value());
}

TEST_CASE("Planets lost mid-run suppress their events instead of corrupting them")
{
    auto engine = moving_sky();
    // Everything fails from the middle of the month on
    engine.fail_after(kSeptemberStartJd + 15.0);

    const auto result = MonthlyDriver(engine, september_2025()).run();
    REQUIRE(result.has_value());
    CHECK(result->samples.size() == 2880);
    CHECK(result->samples.back().snapshot.empty());

    for (const events::IngressEvent& e : result->ingresses)
    {
        CHECK(e.datetime < "2025-09-16 07:00:00");
    }
}
