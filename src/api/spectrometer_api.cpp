#include "api/spectrometer_api.hpp"
#include "broker/broker.hpp"
#include "utils/Logger.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace elworkbench::api
{

using broker::ApiResult;
using broker::ApiStatus;
using broker::ErrorKind;

namespace
{
bool integration_in_range(std::uint32_t ms)
{
    return ms >= SpectrometerApi::kMinIntegrationMs && ms <= SpectrometerApi::kMaxIntegrationMs;
}
} // namespace

SpectrometerApi::SpectrometerApi(broker::Broker &broker, std::unique_ptr<device::SpectrometerAdapter> adapter,
                                 SpectrometerApiOptions options)
    : DeviceCapabilityApi(kCapabilityName, broker, require_adapter(adapter), options.session),
      m_adapter(std::move(adapter)), m_integration_ms(options.integration_time_ms)
{
    if (!integration_in_range(options.integration_time_ms))
    {
        throw std::invalid_argument(fmt::format("SpectrometerApi: integration time {} ms outside [{}, {}] ms",
                                                options.integration_time_ms, kMinIntegrationMs, kMaxIntegrationMs));
    }
}

SpectrometerApi::~SpectrometerApi()
{
    m_adapter->disconnect();
}

ApiResult<SpectrometerIdentity> SpectrometerApi::connect(const std::string &port)
{
    using Identity = SpectrometerIdentity;
    auto result = with_session<Identity>("connect", [&]() -> ApiResult<Identity> {
        if (auto st = open_session(port); st.is_error())
            return ApiResult<Identity>::error(st.error(), st.message());
        try
        {
            Identity id{m_adapter->model(), m_adapter->serial_number()};
            m_adapter->set_integration_time_us(m_integration_ms.load() * 1000u);
            return ApiResult<Identity>::ok(std::move(id));
        }
        catch (const std::runtime_error &ex)
        {
            m_adapter->disconnect();
            return broker::failure<Identity>(ErrorKind::DeviceCommunication,
                                             fmt::format("setup on {} failed: {}", port, ex.what()));
        }
    });
    if (result.is_ok())
    {
        status().info(fmt::format("[{}] connected to {} (S/N {}) on {}, integration time {} ms", name(),
                                  result.content().model, result.content().serial_number, port,
                                  m_integration_ms.load()));
    }
    return result;
}

ApiResult<SpectrometerIdentity> SpectrometerApi::identity()
{
    return run_sequence<SpectrometerIdentity>("read identity", [&] {
        SpectrometerIdentity id{m_adapter->model(), m_adapter->serial_number()};
        return ApiResult<SpectrometerIdentity>::ok(std::move(id));
    });
}

ApiStatus SpectrometerApi::set_integration_time_ms(std::uint32_t ms)
{
    if (!integration_in_range(ms))
    {
        return report_failure(ErrorKind::Validation, fmt::format("integration time {} ms outside [{}, {}] ms", ms,
                                                                 kMinIntegrationMs, kMaxIntegrationMs));
    }
    auto st = run_sequence<void>("set integration time", [&] {
        m_adapter->set_integration_time_us(ms * 1000u);
        m_integration_ms.store(ms);
        return ApiStatus::ok();
    });
    if (st.is_ok())
        status().info(fmt::format("[{}] integration time set to {} ms", name(), ms));
    return st;
}

ApiResult<Spectrum> SpectrometerApi::acquire(const device::CancellationToken &cancel)
{
    if (cancel.is_cancelled())
        return report_failure<Spectrum>(ErrorKind::Cancelled, "acquisition cancelled before start");

    return run_sequence<Spectrum>("acquire spectrum", [&]() -> ApiResult<Spectrum> {
        Spectrum spectrum;
        spectrum.wavelengths = m_adapter->wavelengths();
        if (cancel.is_cancelled())
            return broker::failure<Spectrum>(ErrorKind::Cancelled, "acquisition cancelled");
        spectrum.intensities = m_adapter->intensities();
        if (spectrum.wavelengths.size() != spectrum.intensities.size())
        {
            throw broker::DeviceCommunicationError(fmt::format("{} wavelengths but {} intensities",
                                                               spectrum.wavelengths.size(),
                                                               spectrum.intensities.size()));
        }
        LOGGER_TRACE("SpectrometerApi: acquired {} pixels", spectrum.intensities.size());
        return ApiResult<Spectrum>::ok(std::move(spectrum));
    });
}

} // namespace elworkbench::api
