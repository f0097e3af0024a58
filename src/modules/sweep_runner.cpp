#include "modules/sweep_runner.hpp"
#include "utils/Logger.hpp"

#include <cmath>
#include <stdexcept>

#include <fmt/format.h>

namespace elworkbench::modules
{

using broker::ApiResult;
using broker::ApiStatus;
using broker::ErrorKind;
using broker::VolatileSlot;

namespace
{
// Absorbs rounding in (end - start) / step so that an end value reached by
// the step is included exactly once, with no extra point past it.
constexpr double kStepTolerance = 1e-9;
} // namespace

const char *to_string(SweepOutcome outcome) noexcept
{
    switch (outcome)
    {
    case SweepOutcome::Completed: return "completed";
    case SweepOutcome::Cancelled: return "cancelled";
    case SweepOutcome::Failed: return "failed";
    }
    return "unknown";
}

SweepRunner::SweepRunner(broker::Broker &broker)
    : m_broker(broker), m_smu(broker.get_capability_as<api::SmuApi>(api::SmuApi::kCapabilityName))
{
    if (!broker.volatile_buffer().declare_producer({VolatileSlot::SweepX, VolatileSlot::SweepY},
                                                   kProducerId))
        throw std::logic_error(fmt::format("{}: output slots already have a producer", kProducerId));
}

SweepRunner::~SweepRunner()
{
    stop();
    wait();
    for (const auto slot : {VolatileSlot::SweepX, VolatileSlot::SweepY})
        m_broker.volatile_buffer().release_producer(slot, kProducerId);
}

ApiResult<std::vector<double>> SweepRunner::sweep_points(double start, double end, double step)
{
    using Points = std::vector<double>;
    if (!std::isfinite(start) || !std::isfinite(end) || !std::isfinite(step))
        return broker::failure<Points>(ErrorKind::Validation, "sweep start, end and step must be finite numbers");
    if (step == 0.0)
        return broker::failure<Points>(ErrorKind::Validation, "sweep step must not be zero");
    if ((end - start) * step < 0.0)
    {
        return broker::failure<Points>(ErrorKind::Validation,
                                       fmt::format("step {} does not lead from {} to {}", step, start, end));
    }

    // arange(start, end + step, step): a step that does not divide the range
    // ends one step past `end`.
    const double point_count = std::ceil((end - start) / step + 1.0 - kStepTolerance);
    if (point_count > static_cast<double>(kMaxPoints))
    {
        return broker::failure<Points>(ErrorKind::Validation,
                                       fmt::format("sweep would take {} points, at most {} allowed", point_count,
                                                   kMaxPoints));
    }

    const auto count = static_cast<std::size_t>(point_count);
    Points points(count);
    for (std::size_t i = 0; i < count; ++i)
        points[i] = start + static_cast<double>(i) * step;
    return ApiResult<Points>::ok(std::move(points));
}

ApiStatus SweepRunner::start(const SweepParameters &params)
{
    auto report = [&](ErrorKind kind, const std::string &detail) {
        m_broker.status().warning(fmt::format("[sweep] {}: {}", broker::to_string(kind), detail));
        return broker::failure(kind, detail);
    };

    auto levels = sweep_points(params.start, params.end, params.step);
    if (levels.is_error())
    {
        m_broker.status().warning("[sweep] " + levels.message());
        return ApiStatus::error(levels.error(), levels.message());
    }

    if (!device::parse_channel(params.channel))
        return report(ErrorKind::Validation, fmt::format("unknown SMU channel '{}'", params.channel));
    if (params.point_delay.count() < 0)
        return report(ErrorKind::Validation, "point delay must not be negative");

    const auto &limits = m_smu->limits();
    const double level_max = params.is_voltage_sweep ? limits.max_voltage : limits.max_current;
    const double limit_max = params.is_voltage_sweep ? limits.max_current : limits.max_voltage;
    for (const double level : levels.content())
    {
        if (std::fabs(level) > level_max)
            return report(ErrorKind::Validation,
                          fmt::format("sweep level {} outside [{}, {}]", level, -level_max, level_max));
    }
    if (!std::isfinite(params.limit) || params.limit <= 0.0 || params.limit > limit_max)
        return report(ErrorKind::Validation, fmt::format("compliance limit {} outside (0, {}]", params.limit, limit_max));

    std::thread finished;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running.load())
            return report(ErrorKind::DeviceBusy, "a sweep is already running");
        finished = std::move(m_worker);
    }
    if (finished.joinable())
        finished.join();

    const std::size_t count = levels.content().size();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_running.load())
            return report(ErrorKind::DeviceBusy, "a sweep is already running");
        m_cancel = device::CancellationSource{};
        m_outcome.reset();
        m_progress.store(0.0);
        m_running.store(true);
        m_worker = std::thread(&SweepRunner::run, this, params, std::move(levels).content(), m_cancel.token());
    }
    m_broker.status().info(fmt::format("[sweep] {} sweep started: {} points from {} to {} on channel {}",
                                       params.is_voltage_sweep ? "voltage" : "current", count, params.start,
                                       params.end, params.channel));
    return ApiStatus::ok();
}

void SweepRunner::stop()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancel.cancel();
    }
    m_wake.notify_all();
}

void SweepRunner::wait()
{
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_worker.joinable() && m_worker.get_id() != std::this_thread::get_id())
            worker = std::move(m_worker);
    }
    if (worker.joinable())
        worker.join();
}

std::optional<SweepOutcome> SweepRunner::last_outcome() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_outcome;
}

void SweepRunner::run(SweepParameters params, std::vector<double> levels, device::CancellationToken cancel)
{
    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(levels.size());
    ys.reserve(levels.size());

    auto publish = [&]() -> ApiStatus {
        if (auto st = m_broker.set_volatile(VolatileSlot::SweepX, kProducerId, xs); st.is_error())
            return st;
        return m_broker.set_volatile(VolatileSlot::SweepY, kProducerId, ys);
    };

    // Readers see an empty trace instead of the previous run.
    if (auto st = publish(); st.is_error())
    {
        finish(SweepOutcome::Failed, st.message());
        return;
    }

    for (std::size_t i = 0; i < levels.size(); ++i)
    {
        if (cancel.is_cancelled())
        {
            finish(SweepOutcome::Cancelled, fmt::format("after {} of {} points", i, levels.size()));
            return;
        }

        auto result = m_smu->apply_and_measure(params.channel, params.is_voltage_sweep, levels[i], params.limit,
                                               cancel);
        if (result.is_error())
        {
            if (result.error() == ErrorKind::Cancelled)
                finish(SweepOutcome::Cancelled, fmt::format("after {} of {} points", i, levels.size()));
            else
                finish(SweepOutcome::Failed, fmt::format("at point {} ({}): {}", i + 1, levels[i], result.message()));
            return;
        }

        const auto &reading = result.content();
        xs.push_back(params.is_voltage_sweep ? reading.voltage : reading.current);
        ys.push_back(params.is_voltage_sweep ? reading.current : reading.voltage);
        if (auto st = publish(); st.is_error())
        {
            finish(SweepOutcome::Failed, st.message());
            return;
        }
        m_progress.store(static_cast<double>(i + 1) / static_cast<double>(levels.size()));

        if (i + 1 < levels.size() && params.point_delay.count() > 0)
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_wake.wait_for(lock, params.point_delay, [&] { return cancel.is_cancelled(); });
        }
    }
    finish(SweepOutcome::Completed, fmt::format("{} points", levels.size()));
}

void SweepRunner::finish(SweepOutcome outcome, const std::string &detail)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_outcome = outcome;
    }
    const std::string text = fmt::format("[sweep] sweep {}: {}", to_string(outcome), detail);
    if (outcome == SweepOutcome::Failed)
        m_broker.status().error(text);
    else
        m_broker.status().info(text);
    LOGGER_DEBUG("SweepRunner: {}", text);
    m_running.store(false);
}

} // namespace elworkbench::modules
