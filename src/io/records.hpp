#pragma once

/// @file records.hpp
/// @brief Flattening of samples and events into ordered key/value records.

#include "core/types.hpp"
#include "events/aspect_detector.hpp"
#include "events/ingress_detector.hpp"
#include "transit/monthly_driver.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace gochara::io
{
    /// @brief One table row; keys keep insertion order, which becomes column order.
    using Record = nlohmann::ordered_json;
    using Table = std::vector<Record>;

    /// @brief Static utility class building export rows.
    class Records
    {
    public:
        Records() = delete;

        /// @brief Row-level time columns, then 12 columns per present planet.
        [[nodiscard]] static Record snapshot_record(const transit::SampleRecord& sample,
                                                    f64 utc_offset_hours);

        [[nodiscard]] static Record aspect_record(const events::AspectEvent& aspect);
        [[nodiscard]] static Record ingress_record(const events::IngressEvent& ingress);

        [[nodiscard]] static Table snapshot_table(const transit::MonthlyResult& result);
        [[nodiscard]] static Table aspect_table(const std::vector<events::AspectEvent>& aspects);
        [[nodiscard]] static Table ingress_table(const std::vector<events::IngressEvent>& ingresses);

        /// @brief Run description stored in the month-level JSON files.
        /// @param calculation_time ISO 8601 local time of the run.
        [[nodiscard]] static Record run_metadata(const transit::RunParameters& params,
                                                 std::string_view engine_description,
                                                 const std::string& calculation_time);

        /// @brief Round to @p digits fractional digits.
        ///
        /// Correctly rounded from the exact binary value, so 0.015 (stored
        /// slightly below 0.015) becomes 0.01 at two digits.
        [[nodiscard]] static f64 round_to(f64 value, i32 digits);
    };

} // namespace gochara::io
