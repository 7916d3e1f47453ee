#pragma once

/// @file retrograde.hpp
/// @brief Direction-of-motion test for planets.

#include "ephemeris/ephemeris_engine.hpp"

#include <optional>
#include <string_view>

namespace gochara::ephemeris
{
    /// @brief How retrograde motion is decided.
    enum class RetrogradeMethod
    {
        Speed,             ///< Sign of dλ/dt reported by the engine
        FiniteDifference,  ///< Sign of λ(JD + 1) − λ(JD), wrapped to (−180, 180]
    };

    [[nodiscard]] std::string_view to_string(RetrogradeMethod method);
    [[nodiscard]] std::optional<RetrogradeMethod> retrograde_method_from_string(std::string_view text);

    /// @brief Decides whether a planet is retrograde at an instant.
    ///
    /// The finite-difference probe issues one extra engine call per planet.
    /// A failed probe reports direct motion.
    class RetrogradeDetector
    {
    public:
        RetrogradeDetector(EphemerisEngine& engine, RetrogradeMethod method);

        /// @param planet Body being tested.
        /// @param jd_ut Instant of @p current.
        /// @param current Engine result for @p planet at @p jd_ut.
        [[nodiscard]] bool is_retrograde(PlanetId planet, f64 jd_ut,
                                         const EclipticPosition& current) const;

        [[nodiscard]] RetrogradeMethod method() const { return m_method; }

        /// @brief Retrograde iff the longitudinal speed is strictly negative.
        [[nodiscard]] static bool from_speed(f64 longitude_speed);

        /// @brief Wrap a longitude difference into (−180, 180].
        [[nodiscard]] static f64 wrap_delta(f64 delta_deg);

    private:
        EphemerisEngine& m_engine;
        RetrogradeMethod m_method;
    };

} // namespace gochara::ephemeris
