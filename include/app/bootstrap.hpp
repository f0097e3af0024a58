#pragma once
/**
 * @file bootstrap.hpp
 * @brief Wires the broker, the capability APIs and the modules from a WorkbenchConfig.
 *
 * Construction order is broker, device capabilities, profile store and its
 * API, then the modules; members are destroyed in reverse, so module workers
 * are joined before the capabilities they use go away.
 */

#include "api/profile_api.hpp"
#include "api/smu_api.hpp"
#include "api/spectrometer_api.hpp"
#include "app/workbench_config.hpp"
#include "broker/broker.hpp"
#include "device/smu_adapter.hpp"
#include "device/spectrometer_adapter.hpp"
#include "modules/profile_store.hpp"
#include "modules/spectrum_acquisition.hpp"
#include "modules/spectrum_analysis.hpp"
#include "modules/sweep_runner.hpp"

#include <memory>

namespace elworkbench::app
{

/// Adapter for the configured SMU. @throws std::runtime_error when no driver exists for it.
std::unique_ptr<device::SmuAdapter> make_smu_adapter(const WorkbenchConfig &config);

/// Adapter for the configured spectrometer. @throws std::runtime_error when no driver exists for it.
std::unique_ptr<device::SpectrometerAdapter> make_spectrometer_adapter(const WorkbenchConfig &config);

class Workbench
{
  public:
    /**
     * @throws std::runtime_error for an instrument without a driver.
     * @throws broker::DuplicateRegistrationError on a wiring fault.
     */
    explicit Workbench(const WorkbenchConfig &config);

    /// Same wiring with caller-supplied adapters.
    Workbench(const WorkbenchConfig &config, std::unique_ptr<device::SmuAdapter> smu,
              std::unique_ptr<device::SpectrometerAdapter> spectrometer);

    Workbench(const Workbench &) = delete;
    Workbench &operator=(const Workbench &) = delete;

    [[nodiscard]] const WorkbenchConfig &config() const noexcept { return m_config; }
    [[nodiscard]] broker::Broker &broker() noexcept { return m_broker; }
    [[nodiscard]] modules::ProfileStore &profiles() noexcept { return m_profiles; }
    [[nodiscard]] api::SmuApi &smu() noexcept { return *m_smu; }
    [[nodiscard]] api::SpectrometerApi &spectrometer() noexcept { return *m_spectrometer; }
    [[nodiscard]] api::ProfileApi &profile_api() noexcept { return *m_profile_api; }
    [[nodiscard]] modules::SpectrumAcquisition &acquisition() noexcept { return *m_acquisition; }
    [[nodiscard]] modules::SpectrumAnalysis &analysis() noexcept { return *m_analysis; }
    [[nodiscard]] modules::SweepRunner &sweep() noexcept { return *m_sweep; }

  private:
    WorkbenchConfig m_config;
    broker::Broker m_broker;
    std::shared_ptr<api::SmuApi> m_smu;
    std::shared_ptr<api::SpectrometerApi> m_spectrometer;
    modules::ProfileStore m_profiles;
    std::shared_ptr<api::ProfileApi> m_profile_api;
    std::unique_ptr<modules::SpectrumAcquisition> m_acquisition;
    std::unique_ptr<modules::SpectrumAnalysis> m_analysis;
    std::unique_ptr<modules::SweepRunner> m_sweep;
};

} // namespace elworkbench::app
