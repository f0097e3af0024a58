// tests/test_bootstrap.cpp
//
// Workbench wiring from a WorkbenchConfig and one end-to-end measurement
// pass on the simulated instruments.

#include "test_preamble.h"

#include "app/bootstrap.hpp"
#include "device/simulated_smu.hpp"
#include "device/simulated_spectrometer.hpp"

using namespace elworkbench;
using app::Workbench;
using app::WorkbenchConfig;
using broker::VolatileSlot;
using ::testing::ElementsAre;

class WorkbenchTest : public test_utils::TempDirTest
{
  protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        const std::string test = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        config.profiles_dir = dir() / "profiles";
        config.log_dir = dir() / "logs";
        config.smu.port = "BOOT-SMU-" + test;
        config.smu.settle_time = std::chrono::milliseconds(1);
        config.spectrometer.port = "BOOT-SPEC-" + test;
        config.spectrometer.integration_time_ms = 10;
    }

    WorkbenchConfig config;
};

TEST_F(WorkbenchTest, RegistersAllCapabilities)
{
    Workbench bench(config);
    auto &broker = bench.broker();
    EXPECT_THAT(broker.capability_names(), ElementsAre("profile", "smu", "spectrometer"));
    EXPECT_EQ(broker.get_capability_as<api::SmuApi>("smu").get(), &bench.smu());
    EXPECT_EQ(broker.get_capability_as<api::SpectrometerApi>("spectrometer").get(), &bench.spectrometer());
    EXPECT_EQ(broker.get_capability_as<api::ProfileApi>("profile").get(), &bench.profile_api());

    EXPECT_EQ(broker.volatile_buffer().producer_of(VolatileSlot::SpectrumIntensities),
              std::string(modules::SpectrumAcquisition::kProducerId));
    EXPECT_EQ(broker.volatile_buffer().producer_of(VolatileSlot::SweepX),
              std::string(modules::SweepRunner::kProducerId));

    EXPECT_EQ(bench.profile_api().profile_name(), "No profile");
    EXPECT_EQ(bench.smu().state(), device::ConnectionState::Disconnected);
}

TEST_F(WorkbenchTest, ConfigReachesTheCapabilities)
{
    config.smu.max_voltage = 5.0;
    config.smu.max_current = 0.5;
    config.spectrometer.integration_time_ms = 250;
    Workbench bench(config);

    EXPECT_DOUBLE_EQ(bench.smu().limits().max_voltage, 5.0);
    EXPECT_DOUBLE_EQ(bench.smu().limits().max_current, 0.5);
    EXPECT_EQ(bench.spectrometer().integration_time_ms(), 250u);

    ASSERT_TRUE(bench.smu().connect(config.smu.port).is_ok());
    EXPECT_EQ(bench.smu().apply_and_measure('a', true, 6.0, 0.1).error(), broker::ErrorKind::Validation);
}

TEST_F(WorkbenchTest, InstrumentWithoutDriverThrows)
{
    config.smu.simulated = false;
    EXPECT_THROW(app::make_smu_adapter(config), std::runtime_error);
    EXPECT_THROW(Workbench{config}, std::runtime_error);

    config.smu.simulated = true;
    config.spectrometer.simulated = false;
    EXPECT_THROW(app::make_spectrometer_adapter(config), std::runtime_error);
}

TEST_F(WorkbenchTest, AcceptsCallerSuppliedAdapters)
{
    device::SimulatedSmuOptions smu_options;
    smu_options.noise_fraction = 0.0;
    smu_options.resistance_ohm = 1000.0;
    auto smu = std::make_unique<device::SimulatedSmu>(smu_options);
    auto *sim = smu.get();

    Workbench bench(config, std::move(smu), std::make_unique<device::SimulatedSpectrometer>());
    ASSERT_TRUE(bench.smu().connect(config.smu.port).is_ok());
    auto r = bench.smu().apply_and_measure('a', true, 1.0, 0.1);
    ASSERT_TRUE(r.is_ok()) << r.message();
    EXPECT_NEAR(r.content().current, 0.001, 1e-12);
    EXPECT_GT(sim->command_count(), 0u);
}

TEST_F(WorkbenchTest, MeasurementPassEndToEnd)
{
    std::string profile_id;
    {
        // Declared before the workbench: its teardown still reports status.
        std::vector<broker::StatusMessage> seen;
        std::mutex seen_mutex;
        Workbench bench(config);
        bench.broker().status().add_listener([&](const broker::StatusMessage &m) {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(m);
        });

        auto &profiles = bench.profiles();
        ASSERT_TRUE(profiles.load_all().is_ok());
        EXPECT_EQ(profiles.restore_last_used().error(), broker::ErrorKind::NoSelection);
        auto created = profiles.create_profile("Bench run");
        ASSERT_TRUE(created.is_ok()) << created.message();
        profile_id = created.content();
        ASSERT_TRUE(profiles.select_profile(profile_id).is_ok());
        EXPECT_EQ(bench.profile_api().profile_name(), "Bench run");

        ASSERT_TRUE(bench.smu().connect(config.smu.port).is_ok());
        ASSERT_TRUE(bench.spectrometer().connect(config.spectrometer.port).is_ok());

        ASSERT_TRUE(bench.acquisition().acquire_once().is_ok());
        const auto peak = bench.analysis().find_peak();
        ASSERT_TRUE(peak.has_value());
        ASSERT_TRUE(peak->wavelength_nm.has_value());

        modules::SweepParameters sweep;
        sweep.start = 0.0;
        sweep.end = 1.0;
        sweep.step = 0.25;
        sweep.limit = 0.1;
        sweep.point_delay = std::chrono::milliseconds(0);
        ASSERT_TRUE(bench.sweep().start(sweep).is_ok());
        bench.sweep().wait();
        EXPECT_EQ(bench.sweep().last_outcome(), modules::SweepOutcome::Completed);
        const auto xs = bench.broker().get_volatile(VolatileSlot::SweepX);
        ASSERT_TRUE(xs);
        EXPECT_EQ(xs->size(), 5u);

        EXPECT_TRUE(bench.spectrometer().disconnect().is_ok());
        EXPECT_TRUE(bench.smu().disconnect().is_ok());

        std::unique_lock<std::mutex> lock(seen_mutex);
        EXPECT_TRUE(std::none_of(seen.begin(), seen.end(), [](const broker::StatusMessage &m) {
            return m.severity == broker::Severity::Error;
        }));
        lock.unlock();
    }

    // A fresh workbench on the same directories restores the selection.
    Workbench again(config);
    ASSERT_TRUE(again.profiles().load_all().is_ok());
    ASSERT_TRUE(again.profiles().restore_last_used().is_ok());
    EXPECT_EQ(again.profiles().active_profile_id(), profile_id);
    EXPECT_EQ(again.profile_api().profile_name(), "Bench run");
}

TEST_F(WorkbenchTest, DestroyedWhileWorkersRun)
{
    auto bench = std::make_unique<Workbench>(config);
    ASSERT_TRUE(bench->smu().connect(config.smu.port).is_ok());
    ASSERT_TRUE(bench->spectrometer().connect(config.spectrometer.port).is_ok());

    modules::SweepParameters sweep;
    sweep.start = 0.0;
    sweep.end = 1.0;
    sweep.step = 0.001;
    sweep.point_delay = std::chrono::milliseconds(5);
    ASSERT_TRUE(bench->sweep().start(sweep).is_ok());
    ASSERT_TRUE(bench->acquisition().start_continuous(std::chrono::milliseconds(5)).is_ok());
    ASSERT_TRUE(test_utils::wait_until([&] { return bench->acquisition().published_count() > 0; }));

    bench.reset();

    // Both ports are released by the teardown.
    Workbench next(config);
    EXPECT_TRUE(next.smu().connect(config.smu.port).is_ok());
    EXPECT_TRUE(next.spectrometer().connect(config.spectrometer.port).is_ok());
}
