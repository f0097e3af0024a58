#pragma once
/**
 * @file spectrometer_api.hpp
 * @brief Capability "spectrometer": integration time and spectrum acquisition.
 *
 * The integration time is remembered by the API and applied on every connect,
 * so a reconnect after a fault restores the last accepted setting.
 */

#include "api/device_capability.hpp"
#include "device/cancellation.hpp"
#include "device/spectrometer_adapter.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace elworkbench::api
{

struct Spectrum
{
    std::vector<double> wavelengths; ///< nm
    std::vector<double> intensities; ///< counts
};

struct SpectrometerIdentity
{
    std::string model;
    std::string serial_number;
};

struct SpectrometerApiOptions
{
    std::uint32_t integration_time_ms{100};
    device::SessionGatePolicy session{};
};

class SpectrometerApi final : public DeviceCapabilityApi
{
  public:
    static constexpr const char *kCapabilityName = "spectrometer";
    static constexpr std::uint32_t kMinIntegrationMs = 10;
    static constexpr std::uint32_t kMaxIntegrationMs = 10000;

    /// @throws std::invalid_argument if the default integration time is out of range.
    SpectrometerApi(broker::Broker &broker, std::unique_ptr<device::SpectrometerAdapter> adapter,
                    SpectrometerApiOptions options = {});
    ~SpectrometerApi() override;

    broker::ApiResult<SpectrometerIdentity> connect(const std::string &port);
    broker::ApiResult<SpectrometerIdentity> identity();

    broker::ApiStatus set_integration_time_ms(std::uint32_t ms);
    [[nodiscard]] std::uint32_t integration_time_ms() const noexcept { return m_integration_ms.load(); }

    /**
     * @brief Acquire one spectrum.
     *
     * Wavelength and intensity arrays always have the same length; a
     * mismatching instrument reply is a DeviceCommunicationError.
     */
    broker::ApiResult<Spectrum> acquire(const device::CancellationToken &cancel = {});

  private:
    std::unique_ptr<device::SpectrometerAdapter> m_adapter;
    std::atomic<std::uint32_t> m_integration_ms;
};

} // namespace elworkbench::api
