#pragma once
/**
 * @file spectrum_acquisition.hpp
 * @brief Producer of `spectrum_wavelengths` and `spectrum_intensities`.
 *
 * Acquires through the "spectrometer" capability and publishes each spectrum
 * into the volatile buffer. The continuous loop runs on its own worker
 * thread, one acquisition per period, and stops by itself on the first
 * failed acquisition with a WARNING status.
 *
 * The two slots are written one after the other; a reader can observe a new
 * intensities snapshot next to the previous calibration.
 */

#include "api/spectrometer_api.hpp"
#include "broker/broker.hpp"
#include "device/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace elworkbench::modules
{

class SpectrumAcquisition
{
  public:
    static constexpr const char *kProducerId = "spectrum_acquisition";

    /**
     * @throws broker::CapabilityNotFoundError if no SpectrometerApi is registered.
     * @throws std::logic_error if another producer owns one of the spectrum slots.
     */
    explicit SpectrumAcquisition(broker::Broker &broker);
    ~SpectrumAcquisition();

    SpectrumAcquisition(const SpectrumAcquisition &) = delete;
    SpectrumAcquisition &operator=(const SpectrumAcquisition &) = delete;

    /// Acquire one spectrum and publish it.
    broker::ApiStatus acquire_once();

    /**
     * @brief Start the acquisition loop.
     * @param period time between acquisition starts; zero means the current
     *        integration time.
     * @return DeviceBusyError if the loop is already running.
     */
    broker::ApiStatus start_continuous(std::chrono::milliseconds period = std::chrono::milliseconds{0});

    /**
     * @brief Request the loop to end and wait for it. Safe to call when idle.
     *
     * Called from a status listener on the worker thread, it only requests.
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }
    [[nodiscard]] std::uint64_t published_count() const noexcept { return m_published.load(); }

  private:
    broker::ApiStatus acquire_and_publish(const device::CancellationToken &cancel);
    void run_loop(std::chrono::milliseconds period, device::CancellationToken cancel);

    broker::Broker &m_broker;
    std::shared_ptr<api::SpectrometerApi> m_spectrometer;

    std::mutex m_loop_mutex; // m_worker, m_cancel
    std::condition_variable m_wake;
    std::thread m_worker;
    device::CancellationSource m_cancel;
    std::atomic<bool> m_running{false};
    std::atomic<std::uint64_t> m_published{0};
};

} // namespace elworkbench::modules
