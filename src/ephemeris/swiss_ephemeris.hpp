#pragma once

/// @file swiss_ephemeris.hpp
/// @brief EphemerisEngine backed by the Swiss Ephemeris C library.

#include "ephemeris/ephemeris_engine.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace gochara::ephemeris
{
    /// @brief Swiss Ephemeris adapter, sidereal Lahiri frame, mean lunar node.
    ///
    /// The library keeps process-wide state: the constructor sets the data
    /// path and sidereal mode once, the destructor calls swe_close(). Only
    /// one instance should exist at a time.
    ///
    /// With an empty data path the library default is used and missing .se1
    /// files fall back to the built-in Moshier model. A non-empty path that
    /// does not exist is reported by the first calculate() as
    /// CalcError::DataPathMissing.
    class SwissEphemeris final : public EphemerisEngine
    {
    public:
        explicit SwissEphemeris(std::filesystem::path data_path);
        ~SwissEphemeris() override;

        SwissEphemeris(const SwissEphemeris&) = delete;
        SwissEphemeris& operator=(const SwissEphemeris&) = delete;
        SwissEphemeris(SwissEphemeris&&) = delete;
        SwissEphemeris& operator=(SwissEphemeris&&) = delete;

        [[nodiscard]] CalcResult calculate(f64 jd_ut, PlanetId planet) override;
        [[nodiscard]] std::string description() const override;

        /// @brief Library version string reported by swe_version().
        [[nodiscard]] static std::string version();

        /// @brief Swiss Ephemeris body number for a planet, if the engine computes it.
        [[nodiscard]] static std::optional<i32> body_number(PlanetId planet);

    private:
        std::filesystem::path m_data_path;
        std::optional<bool> m_data_path_ok;  ///< Checked lazily on the first calculation
    };

} // namespace gochara::ephemeris
