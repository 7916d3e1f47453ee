#pragma once

#include <glm/glm.hpp>

#include <cstdint>

namespace gochara
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for ephemeris state)
    using Vec3d = glm::dvec3;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kFullCircleDeg  = 360.0;
        constexpr f64 kHalfCircleDeg  = 180.0;
        constexpr f64 kSignSpanDeg    = 30.0;   // Width of one zodiac sign
        constexpr f64 kJ2000          = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kSecondsPerDay  = 86400.0;
    }
}
