#pragma once

/// @file ingress_detector.hpp
/// @brief Sign changes between consecutive snapshots.

#include "core/types.hpp"
#include "ephemeris/planet.hpp"
#include "ephemeris/snapshot.hpp"

#include <string>
#include <vector>

namespace gochara::events
{
    /// @brief A planet entering a new sign.
    ///
    /// degree and longitude describe the position after the transition.
    struct IngressEvent
    {
        ephemeris::PlanetId planet;
        i32 from_sign_index;
        i32 to_sign_index;
        std::string degree;
        f64 longitude;
        std::string datetime;  ///< Local sample time, stamped by the driver
    };

    /// @brief One-step difference of sign indices over a time-ordered stream.
    ///
    /// The previous snapshot is passed in explicitly; the detector holds no
    /// state between calls.
    class IngressDetector
    {
    public:
        IngressDetector() = delete;

        /// @brief Ingresses of every planet present in both snapshots.
        /// @param current Snapshot at the current grid instant.
        /// @param previous Snapshot at the preceding instant, or nullptr on the first sample.
        [[nodiscard]] static std::vector<IngressEvent> detect(const ephemeris::Snapshot& current,
                                                              const ephemeris::Snapshot* previous);
    };

} // namespace gochara::events
