#pragma once

/// @file ephemeris_engine.hpp
/// @brief Abstract source of sidereal ecliptic positions.

#include "core/types.hpp"
#include "ephemeris/planet.hpp"

#include <optional>
#include <string>
#include <utility>

namespace gochara::ephemeris
{
    /// @brief Ecliptic state of one body at one instant (sidereal frame).
    ///
    /// position = (longitude°, latitude°, distance AU),
    /// velocity = the same three quantities per day.
    struct EclipticPosition
    {
        Vec3d position;
        Vec3d velocity;

        [[nodiscard]] f64 longitude() const { return position.x; }
        [[nodiscard]] f64 latitude() const { return position.y; }
        [[nodiscard]] f64 distance() const { return position.z; }
        [[nodiscard]] f64 longitude_speed() const { return velocity.x; }
        [[nodiscard]] f64 latitude_speed() const { return velocity.y; }
        [[nodiscard]] f64 distance_speed() const { return velocity.z; }
    };

    /// @brief Why a calculation produced no position.
    enum class CalcError
    {
        None,
        DataPathMissing,   ///< Configured data directory does not exist (fatal)
        EngineFailure,     ///< Engine returned a negative status (file missing, JD out of range)
        UnsupportedBody,   ///< The engine has no mapping for this PlanetId
    };

    /// @brief Outcome of EphemerisEngine::calculate().
    struct CalcResult
    {
        std::optional<EclipticPosition> position;
        CalcError error = CalcError::None;
        std::string message;

        [[nodiscard]] bool ok() const { return position.has_value(); }

        /// @brief A fatal failure aborts the whole run instead of omitting one planet.
        [[nodiscard]] bool is_fatal() const { return error == CalcError::DataPathMissing; }

        [[nodiscard]] static CalcResult success(const EclipticPosition& pos)
        {
            return CalcResult{.position = pos, .error = CalcError::None, .message = {}};
        }

        [[nodiscard]] static CalcResult failure(CalcError error, std::string message)
        {
            return CalcResult{.position = std::nullopt, .error = error, .message = std::move(message)};
        }
    };

    /// @brief Interface to a numerical ephemeris.
    ///
    /// Implementations are configured once at construction and then queried
    /// sequentially from a single thread.
    class EphemerisEngine
    {
    public:
        virtual ~EphemerisEngine() = default;

        /// @brief Sidereal position and rates of @p planet at @p jd_ut.
        [[nodiscard]] virtual CalcResult calculate(f64 jd_ut, PlanetId planet) = 0;

        /// @brief Human-readable engine name for run metadata.
        [[nodiscard]] virtual std::string description() const = 0;
    };

} // namespace gochara::ephemeris
