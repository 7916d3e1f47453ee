#pragma once

/// @file config.hpp
/// @brief Run configuration: defaults, JSON config file, command-line overrides.

#include "core/types.hpp"
#include "ephemeris/retrograde.hpp"
#include "transit/monthly_driver.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/common.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gochara::core
{
    /// @brief Everything a run needs, after all sources are merged.
    struct Config
    {
        i32 year = 2025;
        i32 month = 9;
        f64 timezone_offset = 7.0;   ///< Hours east of UTC
        i32 step_minutes = 15;
        f64 orb = 1.0;               ///< Degrees
        std::filesystem::path ephemeris_path = "ephemeris_data";
        std::filesystem::path output_dir = "output";
        ephemeris::RetrogradeMethod retrograde_method = ephemeris::RetrogradeMethod::Speed;
        bool per_day_export = true;
        spdlog::level::level_enum log_level = spdlog::level::info;
    };

    enum class CliAction
    {
        Run,
        Help,
        Error,
    };

    struct CliResult
    {
        CliAction action;
        Config config;
        std::string error;  ///< Set when action == CliAction::Error
    };

    /// @brief Static utility class that builds a Config.
    ///
    /// Precedence (lowest first): built-in defaults, the JSON file named by
    /// --config, individual command-line flags.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Parse argv (argv[0] is the program name).
        [[nodiscard]] static CliResult parse_command_line(int argc, const char* const argv[]);

        /// @brief Read a JSON config file on top of @p base.
        /// @return Merged config, or std::nullopt if the file is unreadable or malformed.
        [[nodiscard]] static std::optional<Config> load_file(const std::filesystem::path& path,
                                                             const Config& base);

        /// @brief Apply the keys present in a JSON object on top of @p base.
        ///
        /// Recognized keys: year, month, timezone_offset, step_minutes, orb,
        /// ephemeris_path, output_dir, retrograde_method, per_day_export, log_level.
        /// Unknown keys are ignored with a warning.
        [[nodiscard]] static std::optional<Config> apply_json(const nlohmann::json& document,
                                                              const Config& base);

        /// @brief Range checks.
        /// @return An error message, or std::nullopt if the config is usable.
        [[nodiscard]] static std::optional<std::string> validate(const Config& config);

        /// @brief Driver parameters derived from the config.
        [[nodiscard]] static transit::RunParameters run_parameters(const Config& config);

        [[nodiscard]] static std::string usage(std::string_view program);

        [[nodiscard]] static std::optional<spdlog::level::level_enum> parse_log_level(std::string_view text);

    private:
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
        [[nodiscard]] static std::optional<i32> parse_i32(std::string_view sv);
    };

} // namespace gochara::core
