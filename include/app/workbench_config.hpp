#pragma once
/**
 * @file workbench_config.hpp
 * @brief Typed view of workbench.json.
 *
 * @code{.json}
 * {
 *   "profiles_dir": "data/profiles",
 *   "log_dir": "data/logs",
 *   "log_level": "INFO",
 *   "log_retention_years": 10,
 *   "smu": { "port": "SIM-SMU-0", "simulated": true, "simulated_resistance_ohm": 100.0,
 *            "max_voltage": 40.0, "max_current": 3.0, "settle_time_ms": 100 },
 *   "spectrometer": { "port": "SIM-SPEC-0", "simulated": true, "integration_time_ms": 100 },
 *   "session": { "queue_depth": 4, "acquire_timeout_ms": 2000, "max_consecutive_failures": 3 }
 * }
 * @endcode
 *
 * Relative directories are resolved against the directory of the config file.
 */

#include "broker/errors.hpp"
#include "utils/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace elworkbench::app
{

inline constexpr const char *kConfigFileEnv = "ELWORKBENCH_CONFIG_FILE";
inline constexpr const char *kLogLevelEnv = "ELWORKBENCH_LOG_LEVEL";
inline constexpr const char *kDefaultConfigFile = "config/workbench.json";

struct SmuConfig
{
    std::string port{"SIM-SMU-0"};
    bool simulated{true};
    double simulated_resistance_ohm{100.0};
    double max_voltage{40.0};
    double max_current{3.0};
    std::chrono::milliseconds settle_time{100};
};

struct SpectrometerConfig
{
    std::string port{"SIM-SPEC-0"};
    bool simulated{true};
    std::uint32_t integration_time_ms{100};
};

struct SessionConfig
{
    std::size_t queue_depth{4};
    std::chrono::milliseconds acquire_timeout{2000};
    unsigned max_consecutive_failures{3};
};

struct WorkbenchConfig
{
    std::filesystem::path profiles_dir{"data/profiles"};
    std::filesystem::path log_dir{"data/logs"};
    utils::Logger::Level log_level{utils::Logger::Level::L_INFO};
    unsigned log_retention_years{10};
    SmuConfig smu;
    SpectrometerConfig spectrometer;
    SessionConfig session;
};

/// The document a fresh workbench.json is created with.
nlohmann::json default_config_json();

/**
 * @brief Parse @p doc, taking defaults for missing keys.
 * @param base_dir directory relative paths are resolved against.
 * @return ValidationError naming the offending key.
 */
broker::ApiResult<WorkbenchConfig> parse_config(const nlohmann::json &doc, const std::filesystem::path &base_dir);

/**
 * @brief Load @p path through utils::JsonConfig.
 *
 * A missing file is created with the defaults; keys missing from an existing
 * file are added to it. Fails with IoError when the file cannot be read or
 * written and ValidationError when a value is invalid.
 */
broker::ApiResult<WorkbenchConfig> load_config(const std::filesystem::path &path);

/// $ELWORKBENCH_CONFIG_FILE, else @p fallback.
std::filesystem::path config_path_from_env(const std::filesystem::path &fallback = kDefaultConfigFile);

/// Applies $ELWORKBENCH_LOG_LEVEL; an unknown level is logged and ignored.
void apply_env_overrides(WorkbenchConfig &config);

} // namespace elworkbench::app
