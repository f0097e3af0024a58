#pragma once
/**
 * @file sweep_runner.hpp
 * @brief Voltage or current sweep on one SMU channel, producer of `sweep_x` / `sweep_y`.
 *
 * Points follow arange(start, end + step, step): the end value is included
 * when the step lands on it, and a step that does not divide the range
 * overshoots `end` by less than one step. Each point goes through
 * SmuApi::apply_and_measure on the worker thread; after every point the
 * traces measured so far are republished:
 *
 *   voltage sweep:  x = measured V, y = measured I
 *   current sweep:  x = measured I, y = measured V
 *
 * The run ends on the last point, on stop() (CancelledError) or on the first
 * failed point, and the outcome is reported on the status channel.
 */

#include "api/smu_api.hpp"
#include "broker/broker.hpp"
#include "device/cancellation.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace elworkbench::modules
{

struct SweepParameters
{
    double start{0.0};
    double end{1.0};
    double step{0.1};
    bool is_voltage_sweep{true};
    char channel{'a'};
    double limit{0.1}; ///< compliance on the measured quantity
    std::chrono::milliseconds point_delay{50};
};

enum class SweepOutcome
{
    Completed,
    Cancelled,
    Failed,
};

const char *to_string(SweepOutcome outcome) noexcept;

class SweepRunner
{
  public:
    static constexpr const char *kProducerId = "sweep_runner";
    static constexpr std::size_t kMaxPoints = 10000;

    /**
     * @throws broker::CapabilityNotFoundError if no SmuApi is registered.
     * @throws std::logic_error if another producer owns one of the sweep slots.
     */
    explicit SweepRunner(broker::Broker &broker);
    ~SweepRunner();

    SweepRunner(const SweepRunner &) = delete;
    SweepRunner &operator=(const SweepRunner &) = delete;

    /**
     * @brief The levels a sweep would source.
     * @return ValidationError for a zero or non-finite step, a step pointing
     *         away from @p end, or more than kMaxPoints points. The sweep
     *         limits are checked by start(), against every returned level.
     */
    static broker::ApiResult<std::vector<double>> sweep_points(double start, double end, double step);

    /// Validates and starts the worker; DeviceBusyError while a sweep runs.
    broker::ApiStatus start(const SweepParameters &params);

    /// Request cancellation; the running point finishes with the output switched off.
    void stop();

    /// Block until the current run (if any) has finished.
    void wait();

    [[nodiscard]] bool is_running() const noexcept { return m_running.load(); }
    /// Fraction of points done, 0 … 1.
    [[nodiscard]] double progress() const noexcept { return m_progress.load(); }
    [[nodiscard]] std::optional<SweepOutcome> last_outcome() const;

  private:
    void run(SweepParameters params, std::vector<double> levels, device::CancellationToken cancel);
    void finish(SweepOutcome outcome, const std::string &detail);

    broker::Broker &m_broker;
    std::shared_ptr<api::SmuApi> m_smu;

    mutable std::mutex m_mutex; // m_worker, m_cancel, m_outcome
    std::condition_variable m_wake;
    std::thread m_worker;
    device::CancellationSource m_cancel;
    std::optional<SweepOutcome> m_outcome;
    std::atomic<bool> m_running{false};
    std::atomic<double> m_progress{0.0};
};

} // namespace elworkbench::modules
