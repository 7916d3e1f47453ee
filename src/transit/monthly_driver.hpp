#pragma once

/// @file monthly_driver.hpp
/// @brief Walks a month on a regular grid and collects positions and events.

#include "astro/time_system.hpp"
#include "core/types.hpp"
#include "ephemeris/ephemeris_engine.hpp"
#include "ephemeris/retrograde.hpp"
#include "ephemeris/snapshot.hpp"
#include "events/aspect_detector.hpp"
#include "events/ingress_detector.hpp"

#include <optional>
#include <vector>

namespace gochara::transit
{
    /// @brief What to sample.
    struct RunParameters
    {
        i32 year = 2025;
        i32 month = 9;
        f64 utc_offset_hours = 7.0;
        i32 step_minutes = 15;
        f64 orb_deg = events::AspectDetector::kDefaultOrbDeg;
        ephemeris::RetrogradeMethod retrograde_method = ephemeris::RetrogradeMethod::Speed;
    };

    /// @brief One grid instant with its snapshot.
    struct SampleRecord
    {
        astro::DateTime local;
        astro::DateTime universal;
        f64 julian_day;
        ephemeris::Snapshot snapshot;
    };

    /// @brief Everything a monthly run produces, in time order.
    struct MonthlyResult
    {
        RunParameters parameters;
        std::vector<SampleRecord> samples;
        std::vector<events::AspectEvent> aspects;
        std::vector<events::IngressEvent> ingresses;
    };

    /// @brief Sequential sampler over days 1..N and minute-of-day 0, step, ….
    ///
    /// At each instant: local → UT → JD, snapshot, aspects, ingresses against
    /// the previous snapshot. Events are stamped with the local sample time.
    class MonthlyDriver
    {
    public:
        MonthlyDriver(ephemeris::EphemerisEngine& engine, const RunParameters& params);

        /// @brief Run the whole month.
        /// @return The collected series, or std::nullopt if the engine failed fatally.
        [[nodiscard]] std::optional<MonthlyResult> run() const;

        /// @brief Number of grid instants the run will visit.
        [[nodiscard]] std::size_t sample_count() const;

    private:
        RunParameters m_params;
        ephemeris::SnapshotBuilder m_builder;
        events::AspectDetector m_aspects;
    };

} // namespace gochara::transit
