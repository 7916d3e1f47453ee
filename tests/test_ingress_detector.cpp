/// @file test_ingress_detector.cpp
/// @brief Unit tests for gochara::events::IngressDetector.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/zodiac.hpp"
#include "core/types.hpp"
#include "ephemeris/snapshot.hpp"
#include "events/ingress_detector.hpp"

#include <initializer_list>
#include <utility>

using namespace gochara;
using namespace gochara::ephemeris;
using namespace gochara::events;

namespace
{

Snapshot make_snapshot(std::initializer_list<std::pair<PlanetId, f64>> longitudes)
{
    Snapshot snapshot;
    for (const auto& [planet, longitude] : longitudes)
    {
        const EclipticPosition ecliptic{
            .position = Vec3d{longitude, 0.0, 1.0},
            .velocity = Vec3d{1.0, 0.0, 0.0},
        };
        snapshot.add(SnapshotBuilder::make_position(planet, ecliptic, false));
    }
    return snapshot;
}

} // anonymous namespace

TEST_CASE("First sample has no previous snapshot and no ingress")
{
    const Snapshot current = make_snapshot({{PlanetId::Moon, 120.1}});
    CHECK(IngressDetector::detect(current, nullptr).empty());
}

TEST_CASE("Moon from Cancer into Leo")
{
    const Snapshot previous = make_snapshot({{PlanetId::Sun, 140.0}, {PlanetId::Moon, 119.95}});
    const Snapshot current  = make_snapshot({{PlanetId::Sun, 140.01}, {PlanetId::Moon, 120.08}});

    const auto ingresses = IngressDetector::detect(current, &previous);

    REQUIRE(ingresses.size() == 1);
    const IngressEvent& e = ingresses.front();
    CHECK(e.planet == PlanetId::Moon);
    CHECK(astro::Zodiac::sign_name(e.from_sign_index) == "Cancer");
    CHECK(astro::Zodiac::sign_name(e.to_sign_index) == "Leo");
    CHECK(e.longitude == doctest::Approx(120.08));
    CHECK(e.degree == current.find(PlanetId::Moon)->zodiac.degree_formatted);
}

TEST_CASE("Pisces to Aries across 0°")
{
    const Snapshot previous = make_snapshot({{PlanetId::Mercury, 359.9}});
    const Snapshot current  = make_snapshot({{PlanetId::Mercury, 0.1}});

    const auto ingresses = IngressDetector::detect(current, &previous);

    REQUIRE(ingresses.size() == 1);
    CHECK(ingresses.front().from_sign_index == 11);
    CHECK(ingresses.front().to_sign_index == 0);
}

TEST_CASE("Retrograde re-entry into the previous sign is reported")
{
    const Snapshot previous = make_snapshot({{PlanetId::Mars, 60.01}});
    const Snapshot current  = make_snapshot({{PlanetId::Mars, 59.99}});

    const auto ingresses = IngressDetector::detect(current, &previous);

    REQUIRE(ingresses.size() == 1);
    CHECK(ingresses.front().from_sign_index == 2);
    CHECK(ingresses.front().to_sign_index == 1);
}

TEST_CASE("Planets missing from either snapshot are ignored")
{
    const Snapshot previous = make_snapshot({{PlanetId::Sun, 29.9}});
    const Snapshot current  = make_snapshot({{PlanetId::Sun, 29.95}, {PlanetId::Venus, 30.5}});

    CHECK(IngressDetector::detect(current, &previous).empty());
    CHECK(IngressDetector::detect(previous, &current).empty());
}

TEST_CASE("Several simultaneous ingresses come out in canonical order")
{
    const Snapshot previous = make_snapshot({{PlanetId::Saturn, 89.99}, {PlanetId::Sun, 29.99}});
    const Snapshot current  = make_snapshot({{PlanetId::Saturn, 90.01}, {PlanetId::Sun, 30.01}});

    const auto ingresses = IngressDetector::detect(current, &previous);

    REQUIRE(ingresses.size() == 2);
    CHECK(ingresses[0].planet == PlanetId::Sun);
    CHECK(ingresses[1].planet == PlanetId::Saturn);
}
