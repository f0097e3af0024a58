#pragma once
/**
 * @file smu_adapter.hpp
 * @brief Primitive operations of a two-channel source-measure unit (Keithley 2600 family).
 *
 * Public methods are non-virtual and run through DeviceAdapter::guarded();
 * concrete adapters implement the private do_* hooks. The source limit is
 * the compliance on the complementary quantity: a current limit when
 * sourcing volts, a voltage limit when sourcing amps.
 */

#include "device/device_adapter.hpp"

#include <optional>
#include <string>

namespace elworkbench::device
{

enum class SmuChannel
{
    A,
    B,
};

enum class SourceFunction
{
    DcVolts,
    DcAmps,
};

/// Voltage sensing: at the output terminals (2-wire) or at the sense leads (4-wire).
enum class SenseMode
{
    Local,
    Remote,
};

/// 'a' or 'b'.
char to_char(SmuChannel channel) noexcept;

/// Accepts 'a', 'b', 'A', 'B'.
std::optional<SmuChannel> parse_channel(char c) noexcept;

const char *to_string(SourceFunction function) noexcept;

/// "SENSE_LOCAL" or "SENSE_REMOTE".
const char *to_string(SenseMode mode) noexcept;

struct IvReading
{
    double current{0.0};
    double voltage{0.0};
};

class SmuAdapter : public DeviceAdapter
{
  public:
    using DeviceAdapter::DeviceAdapter;

    /// Instrument identification string (the *IDN? reply).
    std::string identify();

    void reset_channel(SmuChannel channel);
    void set_sense_mode(SmuChannel channel, SenseMode mode);
    void set_source_function(SmuChannel channel, SourceFunction function);
    void set_source_level(SmuChannel channel, SourceFunction function, double level);
    void set_source_limit(SmuChannel channel, SourceFunction function, double limit);
    void set_output(SmuChannel channel, bool on);
    IvReading measure_iv(SmuChannel channel);

  private:
    virtual std::string do_identify() = 0;
    virtual void do_reset_channel(SmuChannel channel) = 0;
    virtual void do_set_sense_mode(SmuChannel channel, SenseMode mode) = 0;
    virtual void do_set_source_function(SmuChannel channel, SourceFunction function) = 0;
    virtual void do_set_source_level(SmuChannel channel, SourceFunction function, double level) = 0;
    virtual void do_set_source_limit(SmuChannel channel, SourceFunction function, double limit) = 0;
    virtual void do_set_output(SmuChannel channel, bool on) = 0;
    virtual IvReading do_measure_iv(SmuChannel channel) = 0;
};

} // namespace elworkbench::device
