#include "device/spectrometer_adapter.hpp"

namespace elworkbench::device
{

std::string SpectrometerAdapter::model()
{
    return guarded("read model", [&] { return do_model(); });
}

std::string SpectrometerAdapter::serial_number()
{
    return guarded("read serial number", [&] { return do_serial_number(); });
}

void SpectrometerAdapter::set_integration_time_us(std::uint32_t micros)
{
    guarded("set integration time", [&] { do_set_integration_time_us(micros); });
}

std::vector<double> SpectrometerAdapter::wavelengths()
{
    return guarded("read wavelengths", [&] { return do_wavelengths(); });
}

std::vector<double> SpectrometerAdapter::intensities()
{
    return guarded("acquire intensities", [&] { return do_intensities(); });
}

} // namespace elworkbench::device
