// src/main.cpp - Gochara monthly transit tables entry point
//
// Pipeline:
//  1. Parse command line / config file
//  2. Configure the Swiss Ephemeris (sidereal Lahiri, mean node)
//  3. Sample the month and detect aspects and ingresses
//  4. Export month-level tables and the per-day event partition
//  5. Print a short summary

#include "astro/time_system.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "ephemeris/swiss_ephemeris.hpp"
#include "io/records.hpp"
#include "io/table_exporter.hpp"
#include "transit/monthly_driver.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>

using namespace gochara;

namespace
{

constexpr int kExitRunFailed = 1;
constexpr int kExitBadConfig = 2;

f64 size_mb(const std::filesystem::path& path)
{
    std::error_code ec;
    const auto bytes = std::filesystem::file_size(path, ec);
    return ec ? 0.0 : static_cast<f64>(bytes) / (1024.0 * 1024.0);
}

void print_sample(const io::Record& first)
{
    const auto field = [&first](const std::string& key) {
        return first.contains(key) ? first[key].get<std::string>() : std::string{"-"};
    };

    GCH_INFO("First record: {}", field("datetime_local"));
    for (const char* planet : {"Sun", "Moon", "Rahu", "Ketu"})
    {
        const std::string p{planet};
        GCH_INFO("  {:<5} {} {} ({})", p, field(p + "_Sign"), field(p + "_Degree"), field(p + "_Motion"));
    }
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    core::Logger::init();

    // -----------------------------------------------------------------------
    // 1. Configuration
    // -----------------------------------------------------------------------
    const core::CliResult cli = core::ConfigLoader::parse_command_line(argc, argv);
    if (cli.action == core::CliAction::Help)
    {
        std::cout << core::ConfigLoader::usage(argc > 0 ? argv[0] : "gochara");
        core::Logger::shutdown();
        return EXIT_SUCCESS;
    }
    if (cli.action == core::CliAction::Error)
    {
        GCH_ERROR("{}", cli.error);
        std::cerr << core::ConfigLoader::usage(argc > 0 ? argv[0] : "gochara");
        core::Logger::shutdown();
        return kExitBadConfig;
    }

    const core::Config& config = cli.config;
    core::Logger::set_level(config.log_level);

    GCH_INFO("Gochara - sidereal planetary positions");
    GCH_INFO("Month: {:02}/{}  UTC offset: {:+}  step: {} min  orb: {}°  retrograde: {}",
             config.month, config.year, config.timezone_offset, config.step_minutes,
             config.orb, ephemeris::to_string(config.retrograde_method));

    // -----------------------------------------------------------------------
    // 2-3. Ephemeris + sampling
    // -----------------------------------------------------------------------
    ephemeris::SwissEphemeris engine(config.ephemeris_path);

    const transit::RunParameters params = core::ConfigLoader::run_parameters(config);
    const transit::MonthlyDriver driver(engine, params);

    const auto result = driver.run();
    if (!result)
    {
        GCH_CRITICAL("Calculation aborted; check --ephe-path ({})", config.ephemeris_path.string());
        core::Logger::shutdown();
        return kExitRunFailed;
    }

    // -----------------------------------------------------------------------
    // 4. Export
    // -----------------------------------------------------------------------
    const io::TableExporter exporter(config.output_dir);
    const io::Record metadata =
        io::Records::run_metadata(params, engine.description(), astro::TimeSystem::now_local_iso());

    const io::ExportSummary month_files = exporter.export_month(*result, metadata);
    if (config.per_day_export)
    {
        const io::ExportSummary day_files = exporter.export_daily(*result);
        GCH_INFO("Per-day export: {} files under {}/YYYY-MM-DD", day_files.written.size(),
                 config.output_dir.string());
    }

    // -----------------------------------------------------------------------
    // 5. Summary
    // -----------------------------------------------------------------------
    GCH_INFO("Files written:");
    for (const auto& path : month_files.written)
    {
        GCH_INFO("  {} ({:.2f} MB)", path.string(), size_mb(path));
    }

    if (!result->samples.empty())
    {
        print_sample(io::Records::snapshot_record(result->samples.front(), params.utc_offset_hours));
    }

    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
