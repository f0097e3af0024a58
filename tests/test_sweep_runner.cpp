// tests/test_sweep_runner.cpp
//
// Sweep point generation, and full sweeps through SmuApi on a simulated
// resistive load.

#include "test_preamble.h"

#include <limits>

#include "api/smu_api.hpp"
#include "broker/broker.hpp"
#include "device/simulated_smu.hpp"
#include "modules/sweep_runner.hpp"

using namespace elworkbench;
using broker::ErrorKind;
using broker::VolatileSlot;
using modules::SweepOutcome;
using modules::SweepParameters;
using modules::SweepRunner;
using ::testing::DoubleNear;
using ::testing::ElementsAre;

TEST(SweepPointsTest, IncludesEndReachedByStep)
{
    auto pts = SweepRunner::sweep_points(0.0, 1.0, 0.25);
    ASSERT_TRUE(pts.is_ok());
    EXPECT_THAT(pts.content(), ElementsAre(0.0, 0.25, 0.5, 0.75, 1.0));

    // 0.1 is not exact in binary; the end still appears once.
    pts = SweepRunner::sweep_points(0.0, 1.0, 0.1);
    ASSERT_TRUE(pts.is_ok());
    ASSERT_EQ(pts.content().size(), 11u);
    EXPECT_NEAR(pts.content().back(), 1.0, 1e-12);
}

TEST(SweepPointsTest, StepNotDividingTheRangeOvershootsEnd)
{
    auto pts = SweepRunner::sweep_points(0.0, 1.0, 0.3);
    ASSERT_TRUE(pts.is_ok());
    EXPECT_THAT(pts.content(), ElementsAre(0.0, DoubleNear(0.3, 1e-12), DoubleNear(0.6, 1e-12),
                                           DoubleNear(0.9, 1e-12), DoubleNear(1.2, 1e-12)));

    pts = SweepRunner::sweep_points(2.0, 0.0, -0.75);
    ASSERT_TRUE(pts.is_ok());
    EXPECT_THAT(pts.content(), ElementsAre(2.0, 1.25, 0.5, -0.25));
}

TEST(SweepPointsTest, DescendingAndSinglePoint)
{
    auto pts = SweepRunner::sweep_points(1.0, -1.0, -0.5);
    ASSERT_TRUE(pts.is_ok());
    EXPECT_THAT(pts.content(), ElementsAre(1.0, 0.5, 0.0, -0.5, -1.0));

    pts = SweepRunner::sweep_points(0.5, 0.5, 0.1);
    ASSERT_TRUE(pts.is_ok());
    EXPECT_THAT(pts.content(), ElementsAre(0.5));
}

TEST(SweepPointsTest, InvalidParameters)
{
    EXPECT_EQ(SweepRunner::sweep_points(0.0, 1.0, 0.0).error(), ErrorKind::Validation);
    EXPECT_EQ(SweepRunner::sweep_points(0.0, 1.0, -0.1).error(), ErrorKind::Validation);
    EXPECT_EQ(SweepRunner::sweep_points(0.0, std::nan(""), 0.1).error(), ErrorKind::Validation);
    EXPECT_EQ(SweepRunner::sweep_points(0.0, 1.0, std::numeric_limits<double>::infinity()).error(),
              ErrorKind::Validation);

    auto too_many = SweepRunner::sweep_points(0.0, 1.0, 1e-5);
    ASSERT_TRUE(too_many.is_error());
    EXPECT_THAT(too_many.message(), ::testing::HasSubstr("at most 10000"));
    EXPECT_TRUE(SweepRunner::sweep_points(0.0, 9999.0, 1.0).is_ok());
}

class SweepRunnerTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        device::SimulatedSmuOptions options;
        options.resistance_ohm = 100.0;
        options.noise_fraction = 0.0;
        auto adapter = std::make_unique<device::SimulatedSmu>(options);
        sim = adapter.get();
        api::SmuApiOptions api_options;
        api_options.settle_time = std::chrono::milliseconds(1);
        smu = std::make_shared<api::SmuApi>(broker, std::move(adapter), api_options);
        broker.register_capability(smu);
        port = fmt::format("SWEEP-{}", ::testing::UnitTest::GetInstance()->current_test_info()->name());
    }

    static SweepParameters quick(double start, double end, double step)
    {
        SweepParameters p;
        p.start = start;
        p.end = end;
        p.step = step;
        p.limit = 0.5;
        p.point_delay = std::chrono::milliseconds(0);
        return p;
    }

    broker::Broker broker;
    device::SimulatedSmu *sim{nullptr};
    std::shared_ptr<api::SmuApi> smu;
    std::string port;
};

TEST_F(SweepRunnerTest, RequiresSmuCapability)
{
    broker::Broker empty;
    EXPECT_THROW(SweepRunner{empty}, broker::CapabilityNotFoundError);

    SweepRunner first(broker);
    EXPECT_THROW(SweepRunner{broker}, std::logic_error);
    EXPECT_EQ(broker.volatile_buffer().producer_of(VolatileSlot::SweepX), std::string(SweepRunner::kProducerId));
}

TEST_F(SweepRunnerTest, SlotsAreReleasedOnDestruction)
{
    {
        SweepRunner first(broker);
    }
    EXPECT_FALSE(broker.volatile_buffer().producer_of(VolatileSlot::SweepX).has_value());
    EXPECT_FALSE(broker.volatile_buffer().producer_of(VolatileSlot::SweepY).has_value());
    EXPECT_NO_THROW(SweepRunner{broker});
}

TEST_F(SweepRunnerTest, VoltageSweepPublishesTraces)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());

    ASSERT_TRUE(runner.start(quick(0.0, 2.0, 0.5)).is_ok());
    runner.wait();
    EXPECT_FALSE(runner.is_running());
    EXPECT_EQ(runner.last_outcome(), SweepOutcome::Completed);
    EXPECT_DOUBLE_EQ(runner.progress(), 1.0);

    const auto xs = broker.get_volatile(VolatileSlot::SweepX);
    const auto ys = broker.get_volatile(VolatileSlot::SweepY);
    ASSERT_TRUE(xs && ys);
    ASSERT_EQ(xs->size(), 5u);
    ASSERT_EQ(ys->size(), 5u);
    for (std::size_t i = 0; i < xs->size(); ++i)
    {
        EXPECT_NEAR((*xs)[i], 0.5 * static_cast<double>(i), 1e-9);
        EXPECT_NEAR((*ys)[i], (*xs)[i] / 100.0, 1e-9);
    }
    EXPECT_FALSE(sim->output_on(device::SmuChannel::A));

    const auto last = broker.status().last_message();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->text, "[sweep] sweep completed: 5 points");
}

TEST_F(SweepRunnerTest, CurrentSweepSwapsAxes)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());

    auto p = quick(0.0, 0.02, 0.01);
    p.is_voltage_sweep = false;
    p.channel = 'b';
    p.limit = 10.0;
    ASSERT_TRUE(runner.start(p).is_ok());
    runner.wait();
    ASSERT_EQ(runner.last_outcome(), SweepOutcome::Completed);

    const auto xs = broker.get_volatile(VolatileSlot::SweepX);
    const auto ys = broker.get_volatile(VolatileSlot::SweepY);
    ASSERT_TRUE(xs && ys);
    ASSERT_EQ(xs->size(), 3u);
    EXPECT_NEAR((*xs)[2], 0.02, 1e-12);
    EXPECT_NEAR((*ys)[2], 2.0, 1e-9);
}

TEST_F(SweepRunnerTest, StopCancelsTheRun)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());

    auto p = quick(0.0, 1.0, 0.01);
    p.point_delay = std::chrono::milliseconds(20);
    ASSERT_TRUE(runner.start(p).is_ok());
    ASSERT_TRUE(test_utils::wait_until([&] { return runner.progress() > 0.0; }));

    runner.stop();
    runner.wait();
    EXPECT_EQ(runner.last_outcome(), SweepOutcome::Cancelled);
    EXPECT_LT(runner.progress(), 1.0);
    EXPECT_FALSE(sim->output_on(device::SmuChannel::A));

    const auto xs = broker.get_volatile(VolatileSlot::SweepX);
    ASSERT_TRUE(xs);
    EXPECT_LT(xs->size(), 101u);
}

TEST_F(SweepRunnerTest, DeviceFailureEndsTheRun)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());
    sim->fail_next_commands(1);

    ASSERT_TRUE(runner.start(quick(0.0, 1.0, 0.5)).is_ok());
    runner.wait();
    EXPECT_EQ(runner.last_outcome(), SweepOutcome::Failed);

    const auto last = broker.status().last_message();
    ASSERT_TRUE(last.has_value());
    EXPECT_EQ(last->severity, broker::Severity::Error);
    EXPECT_THAT(last->text, ::testing::HasSubstr("sweep failed: at point 1"));
}

TEST_F(SweepRunnerTest, NotConnectedFailsAtFirstPoint)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(runner.start(quick(0.0, 1.0, 0.5)).is_ok());
    runner.wait();
    EXPECT_EQ(runner.last_outcome(), SweepOutcome::Failed);
    const auto xs = broker.get_volatile(VolatileSlot::SweepX);
    ASSERT_TRUE(xs);
    EXPECT_TRUE(xs->empty());
}

TEST_F(SweepRunnerTest, StartValidatesBeforeRunning)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());

    EXPECT_EQ(runner.start(quick(0.0, 1.0, 0.0)).error(), ErrorKind::Validation);
    EXPECT_EQ(runner.start(quick(0.0, 50.0, 10.0)).error(), ErrorKind::Validation);
    // The end is within limits but the last level, 45 V, is not.
    EXPECT_EQ(runner.start(quick(0.0, 40.0, 15.0)).error(), ErrorKind::Validation);

    auto p = quick(0.0, 1.0, 0.5);
    p.channel = 'c';
    EXPECT_EQ(runner.start(p).error(), ErrorKind::Validation);

    p = quick(0.0, 1.0, 0.5);
    p.limit = 0.0;
    EXPECT_EQ(runner.start(p).error(), ErrorKind::Validation);

    p = quick(0.0, 1.0, 0.5);
    p.point_delay = std::chrono::milliseconds(-1);
    EXPECT_EQ(runner.start(p).error(), ErrorKind::Validation);

    EXPECT_FALSE(runner.is_running());
    EXPECT_FALSE(runner.last_outcome().has_value());
    EXPECT_EQ(sim->output_on(device::SmuChannel::A), false);
}

TEST_F(SweepRunnerTest, SecondStartWhileRunningIsBusy)
{
    SweepRunner runner(broker);
    ASSERT_TRUE(smu->connect(port).is_ok());

    auto p = quick(0.0, 1.0, 0.1);
    p.point_delay = std::chrono::milliseconds(50);
    ASSERT_TRUE(runner.start(p).is_ok());

    auto again = runner.start(p);
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error(), ErrorKind::DeviceBusy);

    runner.stop();
    runner.wait();

    // A finished runner starts again and resets the outcome.
    ASSERT_TRUE(runner.start(quick(0.0, 0.5, 0.5)).is_ok());
    runner.wait();
    EXPECT_EQ(runner.last_outcome(), SweepOutcome::Completed);
}
