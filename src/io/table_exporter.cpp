/// @file table_exporter.cpp
/// @brief Output directory layout for monthly runs.

#include "io/table_exporter.hpp"

#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "io/csv_writer.hpp"
#include "io/json_writer.hpp"

#include <spdlog/fmt/fmt.h>

#include <map>
#include <system_error>

namespace gochara::io
{

namespace
{

/// Group event rows by the date part of their "datetime" column.
std::map<std::string, Table> group_by_day(const Table& events)
{
    std::map<std::string, Table> by_day;
    for (const Record& event : events)
    {
        const std::string stamp = event.value("datetime", std::string{});
        by_day[stamp.substr(0, stamp.find(' '))].push_back(event);
    }
    return by_day;
}

} // anonymous namespace

TableExporter::TableExporter(std::filesystem::path output_dir)
    : m_output_dir{std::move(output_dir)}
{
}

ExportSummary TableExporter::export_month(const transit::MonthlyResult& result,
                                          const Record& metadata) const
{
    ExportSummary summary;

    std::error_code ec;
    std::filesystem::create_directories(m_output_dir, ec);
    if (ec)
    {
        GCH_CORE_ERROR("TableExporter: Cannot create {}: {}", m_output_dir.string(), ec.message());
        summary.skipped = 6;
        return summary;
    }

    const std::string base = base_name(result.parameters.year, result.parameters.month);

    write_pair(Records::snapshot_table(result),
               m_output_dir / (base + ".csv"),
               m_output_dir / (base + ".json"),
               &metadata, summary);

    write_pair(Records::aspect_table(result.aspects),
               m_output_dir / (base + "_aspects.csv"),
               m_output_dir / (base + "_aspects.json"),
               &metadata, summary);

    write_pair(Records::ingress_table(result.ingresses),
               m_output_dir / (base + "_ingress.csv"),
               m_output_dir / (base + "_ingress.json"),
               &metadata, summary);

    return summary;
}

ExportSummary TableExporter::export_daily(const transit::MonthlyResult& result) const
{
    ExportSummary summary;

    const auto aspects_by_day = group_by_day(Records::aspect_table(result.aspects));
    const auto ingress_by_day = group_by_day(Records::ingress_table(result.ingresses));

    const i32 year = result.parameters.year;
    const i32 month = result.parameters.month;
    const i32 days = astro::TimeSystem::days_in_month(year, month);

    for (i32 day = 1; day <= days; ++day)
    {
        const std::string day_str = fmt::format("{:04}-{:02}-{:02}", year, month, day);
        const std::filesystem::path folder = m_output_dir / day_str;

        std::error_code ec;
        std::filesystem::create_directories(folder, ec);
        if (ec)
        {
            GCH_CORE_DEBUG("TableExporter: Skipping {}: {}", folder.string(), ec.message());
            ++summary.skipped;
            continue;
        }

        const auto aspects = aspects_by_day.find(day_str);
        write_pair(aspects != aspects_by_day.end() ? aspects->second : Table{},
                   folder / "aspects.csv", folder / "aspects.json",
                   nullptr, summary);

        const auto ingresses = ingress_by_day.find(day_str);
        write_pair(ingresses != ingress_by_day.end() ? ingresses->second : Table{},
                   folder / "ingress.csv", folder / "ingress.json",
                   nullptr, summary);
    }

    return summary;
}

std::string TableExporter::base_name(i32 year, i32 month)
{
    return fmt::format("ephemeris_{}_{:02}", year, month);
}

// -----------------------------------------------------------------
// CSV + JSON for one table; metadata == nullptr selects a bare JSON array
// -----------------------------------------------------------------

void TableExporter::write_pair(const Table& table,
                               const std::filesystem::path& csv_path,
                               const std::filesystem::path& json_path,
                               const Record* metadata,
                               ExportSummary& summary) const
{
    if (table.empty())
    {
        GCH_CORE_INFO("TableExporter: No records for {}, nothing written", csv_path.string());
        summary.skipped += 2;
        return;
    }

    if (CsvWriter::write(table, csv_path))
    {
        summary.written.push_back(csv_path);
    }
    else
    {
        ++summary.skipped;
    }

    const bool json_ok = metadata != nullptr
        ? JsonWriter::write_document(table, json_path, *metadata)
        : JsonWriter::write_array(table, json_path);

    if (json_ok)
    {
        summary.written.push_back(json_path);
    }
    else
    {
        ++summary.skipped;
    }
}

} // namespace gochara::io
