#include "device/smu_adapter.hpp"

namespace elworkbench::device
{

char to_char(SmuChannel channel) noexcept
{
    return channel == SmuChannel::A ? 'a' : 'b';
}

std::optional<SmuChannel> parse_channel(char c) noexcept
{
    switch (c)
    {
    case 'a':
    case 'A': return SmuChannel::A;
    case 'b':
    case 'B': return SmuChannel::B;
    default: return std::nullopt;
    }
}

const char *to_string(SourceFunction function) noexcept
{
    return function == SourceFunction::DcVolts ? "DCVOLTS" : "DCAMPS";
}

const char *to_string(SenseMode mode) noexcept
{
    return mode == SenseMode::Local ? "SENSE_LOCAL" : "SENSE_REMOTE";
}

std::string SmuAdapter::identify()
{
    return guarded("identify", [&] { return do_identify(); });
}

void SmuAdapter::reset_channel(SmuChannel channel)
{
    guarded("reset channel", [&] { do_reset_channel(channel); });
}

void SmuAdapter::set_sense_mode(SmuChannel channel, SenseMode mode)
{
    guarded("set sense mode", [&] { do_set_sense_mode(channel, mode); });
}

void SmuAdapter::set_source_function(SmuChannel channel, SourceFunction function)
{
    guarded("set source function", [&] { do_set_source_function(channel, function); });
}

void SmuAdapter::set_source_level(SmuChannel channel, SourceFunction function, double level)
{
    guarded("set source level", [&] { do_set_source_level(channel, function, level); });
}

void SmuAdapter::set_source_limit(SmuChannel channel, SourceFunction function, double limit)
{
    guarded("set source limit", [&] { do_set_source_limit(channel, function, limit); });
}

void SmuAdapter::set_output(SmuChannel channel, bool on)
{
    guarded(on ? "switch output on" : "switch output off", [&] { do_set_output(channel, on); });
}

IvReading SmuAdapter::measure_iv(SmuChannel channel)
{
    return guarded("measure iv", [&] { return do_measure_iv(channel); });
}

} // namespace elworkbench::device
