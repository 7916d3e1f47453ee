/// @file config.cpp
/// @brief Config loading from JSON files and command-line flags.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <vector>

namespace gochara::core
{

namespace
{

constexpr i32 kMinutesPerDay = 24 * 60;
constexpr f64 kMaxUtcOffsetHours = 14.0;

/// Flags that take a value, e.g. "--year 2025" or "--year=2025".
bool takes_value(std::string_view flag)
{
    return flag == "--config" || flag == "--year" || flag == "--month" || flag == "--tz"
        || flag == "--step" || flag == "--orb" || flag == "--ephe-path" || flag == "--output"
        || flag == "--retrograde" || flag == "--log-level";
}

} // anonymous namespace

// -----------------------------------------------------------------
// Command line
// -----------------------------------------------------------------

CliResult ConfigLoader::parse_command_line(int argc, const char* const argv[])
{
    const auto fail = [](std::string message) {
        return CliResult{.action = CliAction::Error, .config = {}, .error = std::move(message)};
    };

    // Split "--flag=value" and "--flag value" into pairs
    std::vector<std::pair<std::string_view, std::string_view>> flags;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg{argv[i]};
        std::string_view value;

        if (const auto eq = arg.find('='); eq != std::string_view::npos)
        {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
        }
        else if (takes_value(arg))
        {
            if (i + 1 >= argc)
            {
                return fail("missing value for " + std::string{arg});
            }
            value = argv[++i];
        }

        flags.emplace_back(arg, value);
    }

    // -----------------------------------------------------------------
    // Config file first, so individual flags override it
    // -----------------------------------------------------------------
    Config config;
    for (const auto& [flag, value] : flags)
    {
        if (flag == "--help" || flag == "-h")
        {
            return CliResult{.action = CliAction::Help, .config = config, .error = {}};
        }
        if (flag == "--config")
        {
            auto loaded = load_file(std::filesystem::path{value}, config);
            if (!loaded)
            {
                return fail("cannot load config file " + std::string{value});
            }
            config = *loaded;
        }
    }

    for (const auto& [flag, value] : flags)
    {
        if (flag == "--config" || flag == "--help" || flag == "-h")
        {
            continue;
        }

        if (flag == "--year" || flag == "--month" || flag == "--step")
        {
            const auto number = parse_i32(value);
            if (!number)
            {
                return fail("invalid integer for " + std::string{flag} + ": " + std::string{value});
            }
            if (flag == "--year")       config.year = *number;
            else if (flag == "--month") config.month = *number;
            else                        config.step_minutes = *number;
        }
        else if (flag == "--tz" || flag == "--orb")
        {
            const auto number = parse_f64(value);
            if (!number)
            {
                return fail("invalid number for " + std::string{flag} + ": " + std::string{value});
            }
            if (flag == "--tz") config.timezone_offset = *number;
            else                config.orb = *number;
        }
        else if (flag == "--ephe-path")
        {
            config.ephemeris_path = std::filesystem::path{value};
        }
        else if (flag == "--output")
        {
            config.output_dir = std::filesystem::path{value};
        }
        else if (flag == "--retrograde")
        {
            const auto method = ephemeris::retrograde_method_from_string(value);
            if (!method)
            {
                return fail("unknown retrograde method: " + std::string{value});
            }
            config.retrograde_method = *method;
        }
        else if (flag == "--log-level")
        {
            const auto level = parse_log_level(value);
            if (!level)
            {
                return fail("unknown log level: " + std::string{value});
            }
            config.log_level = *level;
        }
        else if (flag == "--no-daily")
        {
            config.per_day_export = false;
        }
        else
        {
            return fail("unknown option: " + std::string{flag});
        }
    }

    if (auto error = validate(config))
    {
        return fail(*error);
    }

    return CliResult{.action = CliAction::Run, .config = config, .error = {}};
}

// -----------------------------------------------------------------
// JSON config file
// -----------------------------------------------------------------

std::optional<Config> ConfigLoader::load_file(const std::filesystem::path& path, const Config& base)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        GCH_CORE_ERROR("Config: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    const nlohmann::json document = nlohmann::json::parse(file, nullptr, /*allow_exceptions=*/false);
    if (document.is_discarded())
    {
        GCH_CORE_ERROR("Config: Invalid JSON in {}", path.string());
        return std::nullopt;
    }

    auto config = apply_json(document, base);
    if (config)
    {
        GCH_CORE_INFO("Config: Loaded {}", path.string());
    }
    return config;
}

std::optional<Config> ConfigLoader::apply_json(const nlohmann::json& document, const Config& base)
{
    if (!document.is_object())
    {
        GCH_CORE_ERROR("Config: Top-level JSON value must be an object");
        return std::nullopt;
    }

    Config config = base;

    try
    {
        for (const auto& [key, value] : document.items())
        {
            if (key == "year")                  config.year = value.get<i32>();
            else if (key == "month")            config.month = value.get<i32>();
            else if (key == "timezone_offset")  config.timezone_offset = value.get<f64>();
            else if (key == "step_minutes")     config.step_minutes = value.get<i32>();
            else if (key == "orb")              config.orb = value.get<f64>();
            else if (key == "ephemeris_path")   config.ephemeris_path = value.get<std::string>();
            else if (key == "output_dir")       config.output_dir = value.get<std::string>();
            else if (key == "per_day_export")   config.per_day_export = value.get<bool>();
            else if (key == "retrograde_method")
            {
                const auto method = ephemeris::retrograde_method_from_string(value.get<std::string>());
                if (!method)
                {
                    GCH_CORE_ERROR("Config: Unknown retrograde_method: {}", value.dump());
                    return std::nullopt;
                }
                config.retrograde_method = *method;
            }
            else if (key == "log_level")
            {
                const auto level = parse_log_level(value.get<std::string>());
                if (!level)
                {
                    GCH_CORE_ERROR("Config: Unknown log_level: {}", value.dump());
                    return std::nullopt;
                }
                config.log_level = *level;
            }
            else
            {
                GCH_CORE_WARN("Config: Ignoring unknown key \"{}\"", key);
            }
        }
    }
    catch (const nlohmann::json::exception& e)
    {
        GCH_CORE_ERROR("Config: Wrong value type: {}", e.what());
        return std::nullopt;
    }

    return config;
}

// -----------------------------------------------------------------
// Validation
// -----------------------------------------------------------------

std::optional<std::string> ConfigLoader::validate(const Config& config)
{
    if (config.month < 1 || config.month > 12)
    {
        return "month must be in 1..12, got " + std::to_string(config.month);
    }
    if (config.year < 1 || config.year > 9999)
    {
        return "year must be in 1..9999, got " + std::to_string(config.year);
    }
    if (!std::isfinite(config.timezone_offset) || std::abs(config.timezone_offset) > kMaxUtcOffsetHours)
    {
        return "timezone offset must be within ±14 hours";
    }
    if (config.step_minutes <= 0 || kMinutesPerDay % config.step_minutes != 0)
    {
        return "step must be a positive divisor of 1440 minutes, got " + std::to_string(config.step_minutes);
    }
    if (!std::isfinite(config.orb) || config.orb <= 0.0 || config.orb > 30.0)
    {
        return "orb must be in (0, 30] degrees";
    }
    if (config.output_dir.empty())
    {
        return "output directory must not be empty";
    }
    return std::nullopt;
}

transit::RunParameters ConfigLoader::run_parameters(const Config& config)
{
    return transit::RunParameters{
        .year              = config.year,
        .month             = config.month,
        .utc_offset_hours  = config.timezone_offset,
        .step_minutes      = config.step_minutes,
        .orb_deg           = config.orb,
        .retrograde_method = config.retrograde_method,
    };
}

std::string ConfigLoader::usage(std::string_view program)
{
    return "Usage: " + std::string{program} + " [options]\n"
        "\n"
        "Sidereal (Lahiri) planetary positions, aspects and ingresses for one month.\n"
        "\n"
        "Options:\n"
        "  --config <file>        JSON config file (flags below override it)\n"
        "  --year <n>             Year (default 2025)\n"
        "  --month <1-12>         Month (default 9)\n"
        "  --tz <hours>           UTC offset of the local time grid (default 7)\n"
        "  --step <minutes>       Grid step, a divisor of 1440 (default 15)\n"
        "  --orb <degrees>        Aspect orb (default 1.0)\n"
        "  --ephe-path <dir>      Swiss Ephemeris data directory (default ephemeris_data,\n"
        "                         empty string = library default)\n"
        "  --output <dir>         Output directory (default output)\n"
        "  --retrograde <method>  speed | finite-difference (default speed)\n"
        "  --no-daily             Skip the per-day event folders\n"
        "  --log-level <level>    trace | debug | info | warn | error (default info)\n"
        "  -h, --help             Show this message\n";
}

std::optional<spdlog::level::level_enum> ConfigLoader::parse_log_level(std::string_view text)
{
    if (text == "trace") return spdlog::level::trace;
    if (text == "debug") return spdlog::level::debug;
    if (text == "info")  return spdlog::level::info;
    if (text == "warn")  return spdlog::level::warn;
    if (text == "error") return spdlog::level::err;
    return std::nullopt;
}

// -----------------------------------------------------------------
// Utility: number parsing
// -----------------------------------------------------------------

std::optional<f64> ConfigLoader::parse_f64(std::string_view sv)
{
    // std::from_chars does not accept a leading '+'
    if (!sv.empty() && sv.front() == '+')
    {
        sv.remove_prefix(1);
    }
    if (sv.empty())
    {
        return std::nullopt;
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

std::optional<i32> ConfigLoader::parse_i32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    i32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace gochara::core
