#pragma once
/**
 * @file smu_api.hpp
 * @brief Capability "smu": source-measure control through value-typed calls.
 *
 * The API owns the adapter, hence the device session. Every call:
 *
 *   1. validates its arguments against the instrument-safe ranges
 *      (nothing reaches the adapter on failure),
 *   2. checks the adapter is CONNECTED (DeviceNotReadyError otherwise),
 *   3. takes the session gate (DeviceBusyError when the queue is full or the
 *      wait times out), so command sequences never interleave,
 *   4. converts adapter exceptions to failures reported on the status channel.
 *
 * apply_and_measure() always attempts to switch the output off before it
 * returns, on success, failure and cancellation alike. If that safety command
 * fails the session is marked FAULTED and must be reconnected.
 */

#include "api/device_capability.hpp"
#include "device/cancellation.hpp"
#include "device/smu_adapter.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace elworkbench::api
{

struct SmuLimits
{
    double max_voltage{40.0}; ///< |V| bound for levels and voltage compliance
    double max_current{3.0};  ///< |A| bound for levels and current compliance
};

struct SmuApiOptions
{
    SmuLimits limits{};
    std::chrono::milliseconds settle_time{100};
    device::SessionGatePolicy session{};
};

class SmuApi final : public DeviceCapabilityApi
{
  public:
    static constexpr const char *kCapabilityName = "smu";

    SmuApi(broker::Broker &broker, std::unique_ptr<device::SmuAdapter> adapter, SmuApiOptions options = {});
    ~SmuApi() override;

    /// Opens the session and returns the instrument identification.
    broker::ApiResult<std::string> connect(const std::string &port);
    [[nodiscard]] const SmuLimits &limits() const noexcept { return m_options.limits; }

    /**
     * @brief Source @p level on @p channel, measure, switch the output off.
     * @param channel 'a' or 'b'
     * @param is_voltage_source true: source volts with a current @p limit;
     *        false: source amps with a voltage @p limit.
     * @param cancel checked before the output goes on and during settling.
     */
    broker::ApiResult<device::IvReading> apply_and_measure(char channel, bool is_voltage_source, double level,
                                                           double limit,
                                                           const device::CancellationToken &cancel = {});

    /**
     * @brief Apply sense mode, source function, level and limit without
     *        touching the output or measuring.
     *
     * Validated like apply_and_measure(). The settings take effect the next
     * time the output is switched on with set_output().
     */
    broker::ApiStatus configure_channel(char channel, bool is_voltage_source, double level, double limit,
                                        device::SenseMode sense = device::SenseMode::Local);

    broker::ApiResult<device::IvReading> measure_iv(char channel);
    broker::ApiStatus set_output(char channel, bool on);
    broker::ApiStatus reset_channel(char channel);

  private:
    broker::ApiResult<device::SmuChannel> resolve_channel(char channel) const;
    /// Level and compliance against limits(); failures are reported.
    broker::ApiStatus validate_source(bool is_voltage_source, double level, double limit) const;
    bool switch_output_off(device::SmuChannel channel) noexcept;

    std::unique_ptr<device::SmuAdapter> m_adapter;
    const SmuApiOptions m_options;
};

} // namespace elworkbench::api
