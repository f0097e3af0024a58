#pragma once
/**
 * @file simulated_smu.hpp
 * @brief Keithley 2602 stand-in: a resistive load behind two SMU channels.
 *
 * With the output on, sourcing V yields I = V / R + noise, sourcing I yields
 * V = I * R + noise, where noise ~ N(0, noise_fraction * limit). The measured
 * quantity is clamped to the compliance limit. With the output off both
 * readings are 0. Every primitive is recorded as a TSP-style command line so
 * tests can check what reached the "instrument"; only the most recent
 * `command_log_capacity` lines are kept.
 */

#include "device/smu_adapter.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>
#include <string>
#include <vector>

namespace elworkbench::device
{

struct SimulatedSmuOptions
{
    double resistance_ohm{100.0};
    double noise_fraction{0.1};
    std::uint32_t seed{0}; ///< 0 = nondeterministic
    std::chrono::milliseconds command_delay{0};
    unsigned max_consecutive_failures{3};
    std::size_t command_log_capacity{1024};
};

class SimulatedSmu final : public SmuAdapter
{
  public:
    explicit SimulatedSmu(SimulatedSmuOptions options = {});
    ~SimulatedSmu() override;

    // --- fault injection ---
    /// The next @p count commands throw DeviceCommunicationError.
    void fail_next_commands(unsigned count);
    /// connect() fails while set.
    void fail_open(bool fail);

    // --- inspection ---
    /// The retained command lines, oldest first.
    [[nodiscard]] std::vector<std::string> command_log() const;
    /// Commands sent since construction, including those dropped from the log.
    [[nodiscard]] std::size_t command_count() const;
    [[nodiscard]] bool output_on(SmuChannel channel) const;
    [[nodiscard]] SenseMode sense_mode(SmuChannel channel) const;

  private:
    struct ChannelState
    {
        SourceFunction function{SourceFunction::DcVolts};
        SenseMode sense{SenseMode::Local};
        double level{0.0};
        double limit{0.01};
        bool output{false};
    };

    void do_open(const std::string &port) override;
    void do_close() noexcept override;
    std::string do_identify() override;
    void do_reset_channel(SmuChannel channel) override;
    void do_set_sense_mode(SmuChannel channel, SenseMode mode) override;
    void do_set_source_function(SmuChannel channel, SourceFunction function) override;
    void do_set_source_level(SmuChannel channel, SourceFunction function, double level) override;
    void do_set_source_limit(SmuChannel channel, SourceFunction function, double limit) override;
    void do_set_output(SmuChannel channel, bool on) override;
    IvReading do_measure_iv(SmuChannel channel) override;

    // Records the command and applies injected faults and delay. Caller holds m_mutex.
    void transmit_locked(std::string command);
    ChannelState &channel_locked(SmuChannel channel);

    const SimulatedSmuOptions m_options;
    mutable std::mutex m_mutex;
    std::array<ChannelState, 2> m_channels{};
    std::deque<std::string> m_log;
    std::size_t m_sent{0};
    unsigned m_fail_next{0};
    bool m_fail_open{false};
    std::mt19937 m_rng;
};

} // namespace elworkbench::device
