#pragma once

/// @file table_exporter.hpp
/// @brief Month-level files and the per-day event partition.

#include "io/records.hpp"
#include "transit/monthly_driver.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace gochara::io
{
    /// @brief Paths written by an export pass.
    struct ExportSummary
    {
        std::vector<std::filesystem::path> written;
        std::size_t skipped = 0;  ///< Empty tables and failed writes
    };

    /// @brief Lays out the result of a monthly run under one output directory.
    ///
    ///   <out>/ephemeris_YYYY_MM.csv|json            snapshot table
    ///   <out>/ephemeris_YYYY_MM_aspects.csv|json    aspect events
    ///   <out>/ephemeris_YYYY_MM_ingress.csv|json    ingress events
    ///   <out>/YYYY-MM-DD/aspects.csv|json           per-day aspect events
    ///   <out>/YYYY-MM-DD/ingress.csv|json           per-day ingress events
    ///
    /// Month-level JSON carries the metadata block; per-day JSON is a bare array.
    class TableExporter
    {
    public:
        explicit TableExporter(std::filesystem::path output_dir);

        /// @brief Write the six month-level files.
        [[nodiscard]] ExportSummary export_month(const transit::MonthlyResult& result,
                                                 const Record& metadata) const;

        /// @brief Write one folder per valid day of the month.
        ///
        /// Best effort: a day whose folder or files cannot be written is skipped.
        [[nodiscard]] ExportSummary export_daily(const transit::MonthlyResult& result) const;

        /// @brief "ephemeris_YYYY_MM"
        [[nodiscard]] static std::string base_name(i32 year, i32 month);

        [[nodiscard]] const std::filesystem::path& output_dir() const { return m_output_dir; }

    private:
        void write_pair(const Table& table,
                        const std::filesystem::path& csv_path,
                        const std::filesystem::path& json_path,
                        const Record* metadata,
                        ExportSummary& summary) const;

        std::filesystem::path m_output_dir;
    };

} // namespace gochara::io
