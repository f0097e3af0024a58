#include "modules/spectrum_analysis.hpp"

#include <cmath>

namespace elworkbench::modules
{

using broker::VolatileSlot;

std::optional<std::size_t> SpectrumAnalysis::peak_index_of(const std::vector<double> &values)
{
    std::optional<std::size_t> best;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (std::isnan(values[i]))
            continue;
        if (!best || values[i] > values[*best])
            best = i;
    }
    return best;
}

std::optional<std::size_t> SpectrumAnalysis::peak_index() const
{
    const auto intensities = m_broker.get_volatile(VolatileSlot::SpectrumIntensities);
    if (!intensities)
        return std::nullopt;
    return peak_index_of(*intensities);
}

std::optional<PeakInfo> SpectrumAnalysis::find_peak() const
{
    const auto intensities = m_broker.get_volatile(VolatileSlot::SpectrumIntensities);
    if (!intensities)
        return std::nullopt;
    const auto index = peak_index_of(*intensities);
    if (!index)
        return std::nullopt;

    PeakInfo peak;
    peak.index = *index;
    peak.intensity = (*intensities)[*index];

    const auto wavelengths = m_broker.get_volatile(VolatileSlot::SpectrumWavelengths);
    if (wavelengths && wavelengths->size() == intensities->size())
        peak.wavelength_nm = (*wavelengths)[*index];
    return peak;
}

} // namespace elworkbench::modules
