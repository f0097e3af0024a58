#include "app/workbench_config.hpp"
#include "utils/JsonConfig.hpp"

#include <cmath>
#include <cstdlib>
#include <system_error>

#include <fmt/format.h>

namespace elworkbench::app
{

namespace fs = std::filesystem;
using broker::ApiResult;
using broker::ErrorKind;

namespace
{

/// Adds every key of @p defaults missing from @p base; existing values win.
/// Returns true when anything was added.
bool json_fill_missing(nlohmann::json &base, const nlohmann::json &defaults) noexcept
{
    if (!base.is_object() || !defaults.is_object())
        return false;
    bool changed = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it)
    {
        if (!base.contains(it.key()))
        {
            base[it.key()] = it.value();
            changed = true;
        }
        else if (it.value().is_object() && base.at(it.key()).is_object())
        {
            changed = json_fill_missing(base[it.key()], it.value()) || changed;
        }
    }
    return changed;
}

fs::path resolve_path(const fs::path &base_dir, const std::string &raw)
{
    fs::path p(raw);
    if (p.is_absolute() || base_dir.empty())
        return p.lexically_normal();
    return (base_dir / p).lexically_normal();
}

template <typename T>
T value_or(const nlohmann::json &obj, const char *key, T fallback)
{
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null())
        return fallback;
    return obj.at(key).get<T>();
}

const nlohmann::json &section(const nlohmann::json &doc, const char *key)
{
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (doc.contains(key) && doc.at(key).is_object())
        return doc.at(key);
    return kEmpty;
}

} // namespace

nlohmann::json default_config_json()
{
    const WorkbenchConfig d;
    return nlohmann::json{
        {"profiles_dir", d.profiles_dir.generic_string()},
        {"log_dir", d.log_dir.generic_string()},
        {"log_level", utils::Logger::level_name(d.log_level)},
        {"log_retention_years", d.log_retention_years},
        {"smu",
         {{"port", d.smu.port},
          {"simulated", d.smu.simulated},
          {"simulated_resistance_ohm", d.smu.simulated_resistance_ohm},
          {"max_voltage", d.smu.max_voltage},
          {"max_current", d.smu.max_current},
          {"settle_time_ms", d.smu.settle_time.count()}}},
        {"spectrometer",
         {{"port", d.spectrometer.port},
          {"simulated", d.spectrometer.simulated},
          {"integration_time_ms", d.spectrometer.integration_time_ms}}},
        {"session",
         {{"queue_depth", d.session.queue_depth},
          {"acquire_timeout_ms", d.session.acquire_timeout.count()},
          {"max_consecutive_failures", d.session.max_consecutive_failures}}},
    };
}

ApiResult<WorkbenchConfig> parse_config(const nlohmann::json &doc, const fs::path &base_dir)
{
    if (!doc.is_object())
        return broker::failure<WorkbenchConfig>(ErrorKind::Validation, "configuration root must be a JSON object");

    WorkbenchConfig cfg;
    try
    {
        cfg.profiles_dir = resolve_path(base_dir, value_or<std::string>(doc, "profiles_dir", "data/profiles"));
        cfg.log_dir = resolve_path(base_dir, value_or<std::string>(doc, "log_dir", "data/logs"));

        const auto level_text = value_or<std::string>(doc, "log_level", "INFO");
        const auto level = utils::Logger::parse_level(level_text);
        if (!level)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation,
                                                    fmt::format("log_level: unknown level '{}'", level_text));
        cfg.log_level = *level;

        const auto retention = value_or<long long>(doc, "log_retention_years", 10);
        if (retention < 1)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation,
                                                    "log_retention_years must be at least 1");
        cfg.log_retention_years = static_cast<unsigned>(retention);

        const auto &smu = section(doc, "smu");
        cfg.smu.port = value_or<std::string>(smu, "port", cfg.smu.port);
        cfg.smu.simulated = value_or<bool>(smu, "simulated", cfg.smu.simulated);
        cfg.smu.simulated_resistance_ohm =
            value_or<double>(smu, "simulated_resistance_ohm", cfg.smu.simulated_resistance_ohm);
        cfg.smu.max_voltage = value_or<double>(smu, "max_voltage", cfg.smu.max_voltage);
        cfg.smu.max_current = value_or<double>(smu, "max_current", cfg.smu.max_current);
        const auto settle = value_or<long long>(smu, "settle_time_ms", cfg.smu.settle_time.count());
        if (!(cfg.smu.max_voltage > 0.0) || !std::isfinite(cfg.smu.max_voltage))
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation, "smu.max_voltage must be positive");
        if (!(cfg.smu.max_current > 0.0) || !std::isfinite(cfg.smu.max_current))
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation, "smu.max_current must be positive");
        if (!(cfg.smu.simulated_resistance_ohm > 0.0))
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation,
                                                    "smu.simulated_resistance_ohm must be positive");
        if (settle < 0)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation, "smu.settle_time_ms must not be negative");
        cfg.smu.settle_time = std::chrono::milliseconds(settle);

        const auto &spectrometer_section = section(doc, "spectrometer");
        cfg.spectrometer.port = value_or<std::string>(spectrometer_section, "port", cfg.spectrometer.port);
        cfg.spectrometer.simulated = value_or<bool>(spectrometer_section, "simulated", cfg.spectrometer.simulated);
        const auto integration = value_or<long long>(spectrometer_section, "integration_time_ms", cfg.spectrometer.integration_time_ms);
        if (integration < 10 || integration > 10000)
            return broker::failure<WorkbenchConfig>(
                ErrorKind::Validation,
                fmt::format("spectrometer.integration_time_ms {} outside [10, 10000]", integration));
        cfg.spectrometer.integration_time_ms = static_cast<std::uint32_t>(integration);

        const auto &session = section(doc, "session");
        const auto depth = value_or<long long>(session, "queue_depth", static_cast<long long>(cfg.session.queue_depth));
        const auto timeout = value_or<long long>(session, "acquire_timeout_ms", cfg.session.acquire_timeout.count());
        const auto failures =
            value_or<long long>(session, "max_consecutive_failures", cfg.session.max_consecutive_failures);
        if (depth < 0)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation, "session.queue_depth must not be negative");
        if (timeout <= 0)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation,
                                                    "session.acquire_timeout_ms must be positive");
        if (failures < 1)
            return broker::failure<WorkbenchConfig>(ErrorKind::Validation,
                                                    "session.max_consecutive_failures must be at least 1");
        cfg.session.queue_depth = static_cast<std::size_t>(depth);
        cfg.session.acquire_timeout = std::chrono::milliseconds(timeout);
        cfg.session.max_consecutive_failures = static_cast<unsigned>(failures);
    }
    catch (const nlohmann::json::exception &e)
    {
        return broker::failure<WorkbenchConfig>(ErrorKind::Validation, fmt::format("configuration: {}", e.what()));
    }
    return ApiResult<WorkbenchConfig>::ok(std::move(cfg));
}

ApiResult<WorkbenchConfig> load_config(const fs::path &path)
{
    std::error_code ec;
    if (path.has_parent_path())
    {
        fs::create_directories(path.parent_path(), ec);
        if (ec)
            return broker::failure<WorkbenchConfig>(
                ErrorKind::Io, fmt::format("cannot create '{}': {}", path.parent_path().string(), ec.message()));
    }

    utils::JsonConfig file(path, /*createIfMissing=*/true, &ec);
    // An unreadable file is reported, never overwritten with the defaults.
    if (ec || !file.is_initialized())
        return broker::failure<WorkbenchConfig>(
            ErrorKind::Io, fmt::format("cannot open '{}': {}", path.string(), ec.message()));

    nlohmann::json doc;
    bool extended = false;
    const bool ok = file.with_json_write(
        [&](nlohmann::json &j) {
            if (j.is_null())
                j = nlohmann::json::object();
            extended = json_fill_missing(j, default_config_json());
            doc = j;
        },
        &ec);
    if (!ok)
        return broker::failure<WorkbenchConfig>(
            ErrorKind::Io, fmt::format("cannot update '{}': {}", path.string(), ec.message()));
    if (extended)
        LOGGER_INFO("WorkbenchConfig: added default keys to '{}'", path.string());

    return parse_config(doc, path.parent_path());
}

fs::path config_path_from_env(const fs::path &fallback)
{
    if (const char *env = std::getenv(kConfigFileEnv); env != nullptr && *env != '\0')
        return fs::path(env);
    return fallback;
}

void apply_env_overrides(WorkbenchConfig &config)
{
    const char *env = std::getenv(kLogLevelEnv);
    if (env == nullptr || *env == '\0')
        return;
    if (auto level = utils::Logger::parse_level(env))
    {
        config.log_level = *level;
        return;
    }
    LOGGER_WARN("WorkbenchConfig: ignoring {}='{}' (unknown level)", kLogLevelEnv, env);
}

} // namespace elworkbench::app
