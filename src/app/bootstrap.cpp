#include "app/bootstrap.hpp"
#include "device/simulated_smu.hpp"
#include "device/simulated_spectrometer.hpp"
#include "utils/Logger.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace elworkbench::app
{

namespace
{

device::SessionGatePolicy session_policy(const SessionConfig &session)
{
    device::SessionGatePolicy policy;
    policy.max_waiters = session.queue_depth;
    policy.acquire_timeout = session.acquire_timeout;
    return policy;
}

} // namespace

std::unique_ptr<device::SmuAdapter> make_smu_adapter(const WorkbenchConfig &config)
{
    if (!config.smu.simulated)
        throw std::runtime_error(fmt::format("no SMU driver available for port '{}'", config.smu.port));
    device::SimulatedSmuOptions options;
    options.resistance_ohm = config.smu.simulated_resistance_ohm;
    options.max_consecutive_failures = config.session.max_consecutive_failures;
    return std::make_unique<device::SimulatedSmu>(options);
}

std::unique_ptr<device::SpectrometerAdapter> make_spectrometer_adapter(const WorkbenchConfig &config)
{
    if (!config.spectrometer.simulated)
        throw std::runtime_error(
            fmt::format("no spectrometer driver available for port '{}'", config.spectrometer.port));
    device::SimulatedSpectrometerOptions options;
    options.max_consecutive_failures = config.session.max_consecutive_failures;
    return std::make_unique<device::SimulatedSpectrometer>(options);
}

Workbench::Workbench(const WorkbenchConfig &config)
    : Workbench(config, make_smu_adapter(config), make_spectrometer_adapter(config))
{
}

Workbench::Workbench(const WorkbenchConfig &config, std::unique_ptr<device::SmuAdapter> smu,
                     std::unique_ptr<device::SpectrometerAdapter> spectrometer)
    : m_config(config), m_profiles(config.profiles_dir, m_broker.status())
{
    api::SmuApiOptions smu_options;
    smu_options.limits.max_voltage = config.smu.max_voltage;
    smu_options.limits.max_current = config.smu.max_current;
    smu_options.settle_time = config.smu.settle_time;
    smu_options.session = session_policy(config.session);
    m_smu = std::make_shared<api::SmuApi>(m_broker, std::move(smu), smu_options);

    api::SpectrometerApiOptions spectrometer_options;
    spectrometer_options.integration_time_ms = config.spectrometer.integration_time_ms;
    spectrometer_options.session = session_policy(config.session);
    m_spectrometer = std::make_shared<api::SpectrometerApi>(m_broker, std::move(spectrometer), spectrometer_options);

    m_profile_api = std::make_shared<api::ProfileApi>(m_broker, m_profiles);

    m_broker.register_capability(m_smu);
    m_broker.register_capability(m_spectrometer);
    m_broker.register_capability(m_profile_api);

    m_acquisition = std::make_unique<modules::SpectrumAcquisition>(m_broker);
    m_analysis = std::make_unique<modules::SpectrumAnalysis>(m_broker);
    m_sweep = std::make_unique<modules::SweepRunner>(m_broker);

    LOGGER_INFO("Workbench: capabilities registered, profiles in '{}'", config.profiles_dir.string());
}

} // namespace elworkbench::app
