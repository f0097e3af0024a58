#pragma once
/**
 * @file spectrometer_adapter.hpp
 * @brief Primitive operations of an array spectrometer (Ocean Optics style).
 */

#include "device/device_adapter.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace elworkbench::device
{

class SpectrometerAdapter : public DeviceAdapter
{
  public:
    using DeviceAdapter::DeviceAdapter;

    std::string model();
    std::string serial_number();
    void set_integration_time_us(std::uint32_t micros);
    /// Pixel wavelength calibration in nm.
    std::vector<double> wavelengths();
    /// Triggers one acquisition and returns the counts per pixel.
    std::vector<double> intensities();

  private:
    virtual std::string do_model() = 0;
    virtual std::string do_serial_number() = 0;
    virtual void do_set_integration_time_us(std::uint32_t micros) = 0;
    virtual std::vector<double> do_wavelengths() = 0;
    virtual std::vector<double> do_intensities() = 0;
};

} // namespace elworkbench::device
