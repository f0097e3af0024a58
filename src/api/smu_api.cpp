#include "api/smu_api.hpp"
#include "broker/broker.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <thread>

#include <fmt/format.h>

namespace elworkbench::api
{

using broker::ApiResult;
using broker::ApiStatus;
using broker::ErrorKind;
using device::IvReading;
using device::SenseMode;
using device::SmuChannel;
using device::SourceFunction;

namespace
{
constexpr std::chrono::milliseconds kSettlePollInterval{10};
} // namespace

SmuApi::SmuApi(broker::Broker &broker, std::unique_ptr<device::SmuAdapter> adapter, SmuApiOptions options)
    : DeviceCapabilityApi(kCapabilityName, broker, require_adapter(adapter), options.session),
      m_adapter(std::move(adapter)), m_options(options)
{
}

SmuApi::~SmuApi()
{
    m_adapter->disconnect();
}

ApiResult<SmuChannel> SmuApi::resolve_channel(char channel) const
{
    if (const auto parsed = device::parse_channel(channel))
        return ApiResult<SmuChannel>::ok(*parsed);
    return report_failure<SmuChannel>(ErrorKind::Validation,
                                      fmt::format("unknown SMU channel '{}' (expected 'a' or 'b')", channel));
}

bool SmuApi::switch_output_off(SmuChannel channel) noexcept
{
    try
    {
        m_adapter->set_output(channel, false);
        return true;
    }
    catch (const std::exception &ex)
    {
        m_adapter->mark_faulted(std::string("output could not be switched off: ") + ex.what());
        return false;
    }
}

ApiStatus SmuApi::validate_source(bool is_voltage_source, double level, double limit) const
{
    const double level_max = is_voltage_source ? m_options.limits.max_voltage : m_options.limits.max_current;
    const double limit_max = is_voltage_source ? m_options.limits.max_current : m_options.limits.max_voltage;
    const char *level_unit = is_voltage_source ? "V" : "A";
    const char *limit_unit = is_voltage_source ? "A" : "V";

    if (!std::isfinite(level) || std::fabs(level) > level_max)
    {
        return report_failure(ErrorKind::Validation, fmt::format("level {} {} outside [{}, {}] {}", level,
                                                                 level_unit, -level_max, level_max, level_unit));
    }
    if (!std::isfinite(limit) || limit <= 0.0 || limit > limit_max)
    {
        return report_failure(ErrorKind::Validation, fmt::format("compliance limit {} {} outside (0, {}] {}", limit,
                                                                 limit_unit, limit_max, limit_unit));
    }
    return ApiStatus::ok();
}

ApiResult<std::string> SmuApi::connect(const std::string &port)
{
    auto result = with_session<std::string>("connect", [&]() -> ApiResult<std::string> {
        if (auto st = open_session(port); st.is_error())
            return ApiResult<std::string>::error(st.error(), st.message());
        try
        {
            return ApiResult<std::string>::ok(m_adapter->identify());
        }
        catch (const std::runtime_error &ex)
        {
            m_adapter->disconnect();
            return broker::failure<std::string>(ErrorKind::DeviceCommunication,
                                                fmt::format("no identification reply on {}: {}", port, ex.what()));
        }
    });
    if (result.is_ok())
        status().info(fmt::format("[{}] connected to {} on {}", name(), result.content(), port));
    return result;
}

ApiResult<IvReading> SmuApi::apply_and_measure(char channel, bool is_voltage_source, double level, double limit,
                                               const device::CancellationToken &cancel)
{
    auto resolved = resolve_channel(channel);
    if (resolved.is_error())
        return ApiResult<IvReading>::error(resolved.error(), resolved.message());
    const SmuChannel ch = resolved.content();
    if (auto st = validate_source(is_voltage_source, level, limit); st.is_error())
        return ApiResult<IvReading>::error(st.error(), st.message());
    if (cancel.is_cancelled())
        return report_failure<IvReading>(ErrorKind::Cancelled, "apply and measure cancelled before start");

    const SourceFunction fn = is_voltage_source ? SourceFunction::DcVolts : SourceFunction::DcAmps;
    const char *level_unit = is_voltage_source ? "V" : "A";

    return run_sequence<IvReading>("apply and measure", [&]() -> ApiResult<IvReading> {
        m_adapter->set_source_function(ch, fn);
        m_adapter->set_source_level(ch, fn, level);
        m_adapter->set_source_limit(ch, fn, limit);
        if (cancel.is_cancelled())
            return broker::failure<IvReading>(ErrorKind::Cancelled, "cancelled before the output was switched on");

        m_adapter->set_output(ch, true);

        IvReading reading;
        bool cancelled = false;
        try
        {
            const auto deadline = std::chrono::steady_clock::now() + m_options.settle_time;
            while (std::chrono::steady_clock::now() < deadline)
            {
                if (cancel.is_cancelled())
                {
                    cancelled = true;
                    break;
                }
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                std::this_thread::sleep_for(std::clamp(left, std::chrono::milliseconds(0), kSettlePollInterval));
            }
            if (!cancelled)
                reading = m_adapter->measure_iv(ch);
        }
        catch (const broker::DeviceCommunicationError &)
        {
            switch_output_off(ch);
            throw;
        }

        if (!switch_output_off(ch))
        {
            return broker::failure<IvReading>(ErrorKind::DeviceCommunication,
                                              "output could not be switched off; session FAULTED, reconnect required");
        }
        if (cancelled)
            return broker::failure<IvReading>(ErrorKind::Cancelled, "cancelled while settling; output switched off");

        LOGGER_DEBUG("SmuApi: channel {} {} {} -> I={} A, V={} V", device::to_char(ch), level, level_unit,
                     reading.current, reading.voltage);
        return ApiResult<IvReading>::ok(reading);
    });
}

ApiStatus SmuApi::configure_channel(char channel, bool is_voltage_source, double level, double limit,
                                   SenseMode sense)
{
    auto resolved = resolve_channel(channel);
    if (resolved.is_error())
        return ApiStatus::error(resolved.error(), resolved.message());
    const SmuChannel ch = resolved.content();
    if (auto st = validate_source(is_voltage_source, level, limit); st.is_error())
        return st;

    const SourceFunction fn = is_voltage_source ? SourceFunction::DcVolts : SourceFunction::DcAmps;
    const char *level_unit = is_voltage_source ? "V" : "A";
    auto st = run_sequence<void>("configure channel", [&] {
        m_adapter->set_sense_mode(ch, sense);
        m_adapter->set_source_function(ch, fn);
        m_adapter->set_source_level(ch, fn, level);
        m_adapter->set_source_limit(ch, fn, limit);
        return ApiStatus::ok();
    });
    if (st.is_ok())
    {
        status().info(fmt::format("[{}] channel {} configured: {} level {}, limit {}, {}", name(),
                                  device::to_char(ch), device::to_string(fn), level, limit,
                                  device::to_string(sense)));
    }
    return st;
}

ApiResult<IvReading> SmuApi::measure_iv(char channel)
{
    auto resolved = resolve_channel(channel);
    if (resolved.is_error())
        return ApiResult<IvReading>::error(resolved.error(), resolved.message());
    const SmuChannel ch = resolved.content();
    return run_sequence<IvReading>("measure", [&] { return ApiResult<IvReading>::ok(m_adapter->measure_iv(ch)); });
}

ApiStatus SmuApi::set_output(char channel, bool on)
{
    auto resolved = resolve_channel(channel);
    if (resolved.is_error())
        return ApiStatus::error(resolved.error(), resolved.message());
    const SmuChannel ch = resolved.content();
    auto st = run_sequence<void>("switch output", [&] {
        m_adapter->set_output(ch, on);
        return ApiStatus::ok();
    });
    if (st.is_ok())
        status().info(fmt::format("[{}] channel {} output {}", name(), device::to_char(ch), on ? "ON" : "OFF"));
    return st;
}

ApiStatus SmuApi::reset_channel(char channel)
{
    auto resolved = resolve_channel(channel);
    if (resolved.is_error())
        return ApiStatus::error(resolved.error(), resolved.message());
    const SmuChannel ch = resolved.content();
    auto st = run_sequence<void>("reset channel", [&] {
        m_adapter->reset_channel(ch);
        return ApiStatus::ok();
    });
    if (st.is_ok())
        status().info(fmt::format("[{}] channel {} reset", name(), device::to_char(ch)));
    return st;
}

} // namespace elworkbench::api
