#include "device/simulated_spectrometer.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <thread>

namespace elworkbench::device
{

using broker::DeviceCommunicationError;

namespace
{
struct Band
{
    double amplitude;
    double center_nm;
    double sigma_nm;
};

constexpr std::array<Band, 4> kBands{{
    {25000.0, 1720.0, 30.0}, // C-H first overtone
    {35000.0, 1450.0, 40.0}, // O-H, water
    {20000.0, 2350.0, 50.0}, // C-H combination
    {10000.0, 2050.0, 25.0}, // N-H
}};

constexpr double kNoiseReferenceMs = 20.0;

std::mt19937 make_rng(std::uint32_t seed)
{
    if (seed != 0)
        return std::mt19937(seed);
    std::random_device rd;
    return std::mt19937(rd());
}

double noise_factor(double integration_ms)
{
    if (integration_ms <= kNoiseReferenceMs)
        return 1.0;
    return std::max(0.05, std::pow(kNoiseReferenceMs / integration_ms, 0.7));
}
} // namespace

SimulatedSpectrometer::SimulatedSpectrometer(SimulatedSpectrometerOptions options)
    : SpectrometerAdapter("NIRQuest512 (simulated)", options.max_consecutive_failures),
      m_options(options), m_rng(make_rng(options.seed))
{
}

SimulatedSpectrometer::~SimulatedSpectrometer()
{
    disconnect();
}

void SimulatedSpectrometer::fail_next_commands(unsigned count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fail_next = count;
}

void SimulatedSpectrometer::set_noise_strength(double strength)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_options.noise_strength = std::max(0.0, strength);
}

std::uint32_t SimulatedSpectrometer::integration_time_us() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_integration_us;
}

std::size_t SimulatedSpectrometer::acquisition_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_acquisitions;
}

void SimulatedSpectrometer::check_injected_fault_locked(const char *command)
{
    if (m_fail_next > 0)
    {
        --m_fail_next;
        throw DeviceCommunicationError(std::string("simulated USB failure during ") + command);
    }
}

void SimulatedSpectrometer::do_open(const std::string & /*port*/) {}

void SimulatedSpectrometer::do_close() noexcept {}

std::string SimulatedSpectrometer::do_model()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_injected_fault_locked("model");
    return "NIRQUEST512";
}

std::string SimulatedSpectrometer::do_serial_number()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_injected_fault_locked("serial_number");
    return "SIM-NQ512-0001";
}

void SimulatedSpectrometer::do_set_integration_time_us(std::uint32_t micros)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_injected_fault_locked("integration_time_micros");
    m_integration_us = micros;
}

std::vector<double> SimulatedSpectrometer::do_wavelengths()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_injected_fault_locked("wavelengths");
    std::vector<double> wl(kPixelCount);
    const double step = (kLastWavelengthNm - kFirstWavelengthNm) / static_cast<double>(kPixelCount - 1);
    for (std::size_t i = 0; i < kPixelCount; ++i)
        wl[i] = kFirstWavelengthNm + step * static_cast<double>(i);
    wl.back() = kLastWavelengthNm;
    return wl;
}

std::vector<double> SimulatedSpectrometer::do_intensities()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    check_injected_fault_locked("intensities");
    if (m_options.simulate_exposure)
        std::this_thread::sleep_for(std::chrono::microseconds(m_integration_us));

    const double integration_ms = static_cast<double>(m_integration_us) / 1000.0;
    const double sigma = m_options.noise_strength * noise_factor(integration_ms);
    std::uniform_real_distribution<double> baseline(0.0, 500.0);
    std::normal_distribution<double> noise(0.0, sigma > 0.0 ? sigma : 1.0);

    const double step = (kLastWavelengthNm - kFirstWavelengthNm) / static_cast<double>(kPixelCount - 1);
    std::vector<double> counts(kPixelCount);
    for (std::size_t i = 0; i < kPixelCount; ++i)
    {
        const double x = kFirstWavelengthNm + step * static_cast<double>(i);
        double value = 1000.0 + baseline(m_rng);
        for (const auto &band : kBands)
        {
            const double z = (x - band.center_nm) / band.sigma_nm;
            value += band.amplitude * std::exp(-z * z / 2.0);
        }
        if (sigma > 0.0)
            value += noise(m_rng);
        counts[i] = std::max(0.0, value);
    }
    ++m_acquisitions;
    return counts;
}

} // namespace elworkbench::device
