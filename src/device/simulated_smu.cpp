#include "device/simulated_smu.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

#include <fmt/format.h>

namespace elworkbench::device
{

using broker::DeviceCommunicationError;

namespace
{
constexpr const char *kIdentity = "KEITHLEY INSTRUMENTS INC., MODEL 2602, SIMULATED, 1.0.0";

std::mt19937 make_rng(std::uint32_t seed)
{
    if (seed != 0)
        return std::mt19937(seed);
    std::random_device rd;
    return std::mt19937(rd());
}

// Keeps the sign, caps the magnitude at the compliance limit.
double clamp_to_compliance(double value, double limit)
{
    return std::copysign(std::min(std::fabs(value), std::fabs(limit)), value);
}
} // namespace

SimulatedSmu::SimulatedSmu(SimulatedSmuOptions options)
    : SmuAdapter("Keithley 2602 (simulated)", options.max_consecutive_failures),
      m_options(options), m_rng(make_rng(options.seed))
{
}

SimulatedSmu::~SimulatedSmu()
{
    disconnect();
}

void SimulatedSmu::fail_next_commands(unsigned count)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fail_next = count;
}

void SimulatedSmu::fail_open(bool fail)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_fail_open = fail;
}

std::vector<std::string> SimulatedSmu::command_log() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::vector<std::string>(m_log.begin(), m_log.end());
}

std::size_t SimulatedSmu::command_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sent;
}

bool SimulatedSmu::output_on(SmuChannel channel) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels[channel == SmuChannel::A ? 0 : 1].output;
}

SenseMode SimulatedSmu::sense_mode(SmuChannel channel) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channels[channel == SmuChannel::A ? 0 : 1].sense;
}

void SimulatedSmu::do_open(const std::string &port)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_fail_open)
        throw DeviceCommunicationError("simulated open failure on " + port);
    m_channels = {};
}

void SimulatedSmu::do_close() noexcept
{
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto &ch : m_channels)
        ch.output = false;
}

void SimulatedSmu::transmit_locked(std::string command)
{
    ++m_sent;
    if (m_options.command_log_capacity > 0)
    {
        if (m_log.size() == m_options.command_log_capacity)
            m_log.pop_front();
        m_log.push_back(command);
    }
    if (m_options.command_delay.count() > 0)
        std::this_thread::sleep_for(m_options.command_delay);
    if (m_fail_next > 0)
    {
        --m_fail_next;
        throw DeviceCommunicationError("simulated communication failure on '" + command + "'");
    }
}

SimulatedSmu::ChannelState &SimulatedSmu::channel_locked(SmuChannel channel)
{
    return m_channels[channel == SmuChannel::A ? 0 : 1];
}

std::string SimulatedSmu::do_identify()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    transmit_locked("*IDN?");
    return kIdentity;
}

void SimulatedSmu::do_reset_channel(SmuChannel channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    transmit_locked(fmt::format("smu{}.reset()", to_char(channel)));
    channel_locked(channel) = ChannelState{};
}

void SimulatedSmu::do_set_sense_mode(SmuChannel channel, SenseMode mode)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const char c = to_char(channel);
    transmit_locked(fmt::format("smu{}.sense = smu{}.{}", c, c, to_string(mode)));
    channel_locked(channel).sense = mode;
}

void SimulatedSmu::do_set_source_function(SmuChannel channel, SourceFunction function)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const char c = to_char(channel);
    transmit_locked(fmt::format("smu{}.source.func = smu{}.{}", c, c, to_string(function)));
    channel_locked(channel).function = function;
}

void SimulatedSmu::do_set_source_level(SmuChannel channel, SourceFunction function, double level)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    transmit_locked(fmt::format("smu{}.source.{} = {}", to_char(channel),
                                function == SourceFunction::DcVolts ? "levelv" : "leveli", level));
    channel_locked(channel).level = level;
}

void SimulatedSmu::do_set_source_limit(SmuChannel channel, SourceFunction function, double limit)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    transmit_locked(fmt::format("smu{}.source.{} = {}", to_char(channel),
                                function == SourceFunction::DcVolts ? "limiti" : "limitv", limit));
    channel_locked(channel).limit = limit;
}

void SimulatedSmu::do_set_output(SmuChannel channel, bool on)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const char c = to_char(channel);
    transmit_locked(
        fmt::format("smu{}.source.output = smu{}.{}", c, c, on ? "OUTPUT_ON" : "OUTPUT_OFF"));
    channel_locked(channel).output = on;
}

IvReading SimulatedSmu::do_measure_iv(SmuChannel channel)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    transmit_locked(fmt::format("print(smu{}.measure.iv())", to_char(channel)));

    const ChannelState &st = channel_locked(channel);
    if (!st.output)
        return {0.0, 0.0};

    const double sigma = std::fabs(st.limit) * m_options.noise_fraction;
    const double noise = sigma > 0.0 ? std::normal_distribution<double>(0.0, sigma)(m_rng) : 0.0;

    IvReading reading;
    if (st.function == SourceFunction::DcVolts)
    {
        reading.voltage = st.level;
        reading.current = clamp_to_compliance(st.level / m_options.resistance_ohm + noise, st.limit);
    }
    else
    {
        reading.current = st.level;
        reading.voltage = clamp_to_compliance(st.level * m_options.resistance_ohm + noise, st.limit);
    }
    return reading;
}

} // namespace elworkbench::device
