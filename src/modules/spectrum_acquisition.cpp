#include "modules/spectrum_acquisition.hpp"
#include "utils/Logger.hpp"

#include <stdexcept>

#include <fmt/format.h>

namespace elworkbench::modules
{

using broker::ApiStatus;
using broker::ErrorKind;
using broker::VolatileSlot;

SpectrumAcquisition::SpectrumAcquisition(broker::Broker &broker)
    : m_broker(broker),
      m_spectrometer(broker.get_capability_as<api::SpectrometerApi>(api::SpectrometerApi::kCapabilityName))
{
    if (!broker.volatile_buffer().declare_producer({VolatileSlot::SpectrumWavelengths, VolatileSlot::SpectrumIntensities},
                                                   kProducerId))
        throw std::logic_error(fmt::format("{}: output slots already have a producer", kProducerId));
}

SpectrumAcquisition::~SpectrumAcquisition()
{
    stop();
    for (const auto slot : {VolatileSlot::SpectrumWavelengths, VolatileSlot::SpectrumIntensities})
        m_broker.volatile_buffer().release_producer(slot, kProducerId);
}

ApiStatus SpectrumAcquisition::acquire_and_publish(const device::CancellationToken &cancel)
{
    auto result = m_spectrometer->acquire(cancel);
    if (result.is_error())
        return ApiStatus::error(result.error(), result.message());
    api::Spectrum spectrum = std::move(result).content();

    if (auto st = m_broker.set_volatile(VolatileSlot::SpectrumWavelengths, kProducerId,
                                        std::move(spectrum.wavelengths));
        st.is_error())
        return st;
    if (auto st = m_broker.set_volatile(VolatileSlot::SpectrumIntensities, kProducerId,
                                        std::move(spectrum.intensities));
        st.is_error())
        return st;

    m_published.fetch_add(1);
    return ApiStatus::ok();
}

ApiStatus SpectrumAcquisition::acquire_once()
{
    return acquire_and_publish(device::CancellationToken{});
}

ApiStatus SpectrumAcquisition::start_continuous(std::chrono::milliseconds period)
{
    if (period.count() < 0)
        return broker::failure(ErrorKind::Validation, "acquisition period must not be negative");

    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(m_loop_mutex);
        if (m_running.load())
        {
            m_broker.status().warning("[spectrum_acquisition] continuous acquisition already running");
            return broker::failure(ErrorKind::DeviceBusy, "continuous acquisition already running");
        }
        finished = std::move(m_worker);
    }
    if (finished.joinable())
        finished.join();

    {
        std::lock_guard<std::mutex> lock(m_loop_mutex);
        if (m_running.load())
            return broker::failure(ErrorKind::DeviceBusy, "continuous acquisition already running");
        m_cancel = device::CancellationSource{};
        m_running.store(true);
        m_worker = std::thread(&SpectrumAcquisition::run_loop, this, period, m_cancel.token());
    }
    m_broker.status().info("[spectrum_acquisition] continuous acquisition started");
    return ApiStatus::ok();
}

void SpectrumAcquisition::stop()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_loop_mutex);
        m_cancel.cancel();
        if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id())
            worker = std::move(m_worker);
    }
    m_wake.notify_all();
    if (worker.joinable())
        worker.join();
}

void SpectrumAcquisition::run_loop(std::chrono::milliseconds period, device::CancellationToken cancel)
{
    LOGGER_DEBUG("SpectrumAcquisition: loop started");
    bool aborted = false;
    while (!cancel.is_cancelled())
    {
        const auto interval =
            period.count() > 0 ? period : std::chrono::milliseconds(m_spectrometer->integration_time_ms());
        const auto next = std::chrono::steady_clock::now() + interval;

        auto st = acquire_and_publish(cancel);
        if (st.is_error())
        {
            if (st.error() != ErrorKind::Cancelled)
            {
                m_broker.status().warning(
                    fmt::format("[spectrum_acquisition] continuous acquisition stopped: {}", st.message()));
                aborted = true;
            }
            break;
        }

        std::unique_lock<std::mutex> lock(m_loop_mutex);
        m_wake.wait_until(lock, next, [&] { return cancel.is_cancelled(); });
    }

    if (!aborted)
        m_broker.status().info("[spectrum_acquisition] continuous acquisition stopped");
    LOGGER_DEBUG("SpectrumAcquisition: loop {} after {} spectra", aborted ? "aborted" : "stopped",
                 m_published.load());
    m_running.store(false);
}

} // namespace elworkbench::modules
