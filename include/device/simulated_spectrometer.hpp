#pragma once
/**
 * @file simulated_spectrometer.hpp
 * @brief NIRQuest512 stand-in producing a synthetic NIR spectrum.
 *
 * 512 pixels spanning 903.07996 nm to 2527.059023186984 nm. Each acquisition is
 * a baseline of 1000 + U(0, 500) counts plus four Gaussian bands
 * (35000 @ 1450 nm, 25000 @ 1720 nm, 10000 @ 2050 nm, 20000 @ 2350 nm) and
 * Gaussian noise with sigma = noise_strength * max(0.05, (20 ms / t)^0.7),
 * where t is the integration time (factor 1 at t <= 20 ms). Counts are
 * clamped at zero. An acquisition sleeps for the integration time unless
 * `simulate_exposure` is off.
 */

#include "device/spectrometer_adapter.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace elworkbench::device
{

struct SimulatedSpectrometerOptions
{
    double noise_strength{50.0};
    std::uint32_t seed{0}; ///< 0 = nondeterministic
    bool simulate_exposure{false};
    unsigned max_consecutive_failures{3};
};

class SimulatedSpectrometer final : public SpectrometerAdapter
{
  public:
    static constexpr std::size_t kPixelCount = 512;
    static constexpr double kFirstWavelengthNm = 903.07996;
    static constexpr double kLastWavelengthNm = 2527.059023186984;

    explicit SimulatedSpectrometer(SimulatedSpectrometerOptions options = {});
    ~SimulatedSpectrometer() override;

    /// The next @p count commands throw DeviceCommunicationError.
    void fail_next_commands(unsigned count);
    void set_noise_strength(double strength);
    [[nodiscard]] std::uint32_t integration_time_us() const;
    [[nodiscard]] std::size_t acquisition_count() const;

  private:
    void do_open(const std::string &port) override;
    void do_close() noexcept override;
    std::string do_model() override;
    std::string do_serial_number() override;
    void do_set_integration_time_us(std::uint32_t micros) override;
    std::vector<double> do_wavelengths() override;
    std::vector<double> do_intensities() override;

    void check_injected_fault_locked(const char *command);

    SimulatedSpectrometerOptions m_options;
    mutable std::mutex m_mutex;
    std::uint32_t m_integration_us{100'000};
    unsigned m_fail_next{0};
    std::size_t m_acquisitions{0};
    std::mt19937 m_rng;
};

} // namespace elworkbench::device
