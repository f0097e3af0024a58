#pragma once
/**
 * @file spectrum_analysis.hpp
 * @brief Consumer of the spectrum slots: peak search on the latest snapshot.
 *
 * Nothing is cached; every call pulls the current snapshot from the broker.
 */

#include "broker/broker.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace elworkbench::modules
{

struct PeakInfo
{
    std::size_t index{0};
    double intensity{0.0};
    /// Set when the wavelength slot holds a calibration of matching length.
    std::optional<double> wavelength_nm;
};

class SpectrumAnalysis
{
  public:
    explicit SpectrumAnalysis(const broker::Broker &broker) : m_broker(broker) {}

    /// Index of the first maximum of `spectrum_intensities`; nullopt while EMPTY or empty.
    [[nodiscard]] std::optional<std::size_t> peak_index() const;

    [[nodiscard]] std::optional<PeakInfo> find_peak() const;

    /// First maximum of @p values, ignoring NaNs; nullopt if there is none.
    static std::optional<std::size_t> peak_index_of(const std::vector<double> &values);

  private:
    const broker::Broker &m_broker;
};

} // namespace elworkbench::modules
