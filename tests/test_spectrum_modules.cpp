// tests/test_spectrum_modules.cpp
//
// SpectrumAcquisition publishes through the broker; SpectrumAnalysis reads
// whatever snapshot is current.

#include "test_preamble.h"

#include "api/spectrometer_api.hpp"
#include "broker/broker.hpp"
#include "device/simulated_spectrometer.hpp"
#include "modules/spectrum_acquisition.hpp"
#include "modules/spectrum_analysis.hpp"

using namespace elworkbench;
using broker::ErrorKind;
using broker::VolatileSlot;
using modules::SpectrumAcquisition;
using modules::SpectrumAnalysis;

TEST(SpectrumAnalysisTest, PeakIndexOf)
{
    EXPECT_EQ(SpectrumAnalysis::peak_index_of({0.1, 0.9, 0.2}), 1u);
    EXPECT_EQ(SpectrumAnalysis::peak_index_of({0.4, 0.1, 0.1}), 0u);
    // First of equal maxima.
    EXPECT_EQ(SpectrumAnalysis::peak_index_of({1.0, 3.0, 3.0}), 1u);
    EXPECT_EQ(SpectrumAnalysis::peak_index_of({std::nan(""), 2.0, 1.0}), 1u);
    EXPECT_FALSE(SpectrumAnalysis::peak_index_of({}).has_value());
    EXPECT_FALSE(SpectrumAnalysis::peak_index_of({std::nan(""), std::nan("")}).has_value());
}

TEST(SpectrumAnalysisTest, FollowsTheLatestSnapshot)
{
    broker::Broker broker;
    SpectrumAnalysis analysis(broker);
    EXPECT_FALSE(analysis.peak_index().has_value());
    EXPECT_FALSE(analysis.find_peak().has_value());

    ASSERT_TRUE(broker.volatile_buffer().declare_producer(VolatileSlot::SpectrumIntensities, "test"));
    ASSERT_TRUE(broker.volatile_buffer().declare_producer(VolatileSlot::SpectrumWavelengths, "test"));

    ASSERT_TRUE(broker.set_volatile(VolatileSlot::SpectrumIntensities, "test", {0.1, 0.9, 0.2}).is_ok());
    EXPECT_EQ(analysis.peak_index(), 1u);
    auto peak = analysis.find_peak();
    ASSERT_TRUE(peak.has_value());
    EXPECT_DOUBLE_EQ(peak->intensity, 0.9);
    EXPECT_FALSE(peak->wavelength_nm.has_value());

    ASSERT_TRUE(broker.set_volatile(VolatileSlot::SpectrumIntensities, "test", {0.4, 0.1, 0.1}).is_ok());
    EXPECT_EQ(analysis.peak_index(), 0u);

    ASSERT_TRUE(broker.set_volatile(VolatileSlot::SpectrumWavelengths, "test", {1000.0, 1100.0, 1200.0}).is_ok());
    peak = analysis.find_peak();
    ASSERT_TRUE(peak.has_value());
    ASSERT_TRUE(peak->wavelength_nm.has_value());
    EXPECT_DOUBLE_EQ(*peak->wavelength_nm, 1000.0);

    // A calibration of another length is not paired with the intensities.
    ASSERT_TRUE(broker.set_volatile(VolatileSlot::SpectrumWavelengths, "test", {1000.0, 1100.0}).is_ok());
    peak = analysis.find_peak();
    ASSERT_TRUE(peak.has_value());
    EXPECT_FALSE(peak->wavelength_nm.has_value());

    ASSERT_TRUE(broker.set_volatile(VolatileSlot::SpectrumIntensities, "test", {}).is_ok());
    EXPECT_FALSE(analysis.peak_index().has_value());
}

class SpectrumAcquisitionTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        device::SimulatedSpectrometerOptions options;
        options.seed = 11;
        auto adapter = std::make_unique<device::SimulatedSpectrometer>(options);
        sim = adapter.get();
        api::SpectrometerApiOptions api_options;
        api_options.integration_time_ms = 10;
        spectrometer = std::make_shared<api::SpectrometerApi>(broker, std::move(adapter), api_options);
        broker.register_capability(spectrometer);
        port = fmt::format("SPEC-ACQ-{}", ::testing::UnitTest::GetInstance()->current_test_info()->name());
    }

    broker::Broker broker;
    device::SimulatedSpectrometer *sim{nullptr};
    std::shared_ptr<api::SpectrometerApi> spectrometer;
    std::string port;
};

TEST_F(SpectrumAcquisitionTest, RequiresSpectrometerCapability)
{
    broker::Broker empty;
    EXPECT_THROW(SpectrumAcquisition{empty}, broker::CapabilityNotFoundError);
}

TEST_F(SpectrumAcquisitionTest, SecondProducerIsRejected)
{
    SpectrumAcquisition first(broker);
    EXPECT_THROW(SpectrumAcquisition{broker}, std::logic_error);
    EXPECT_EQ(broker.volatile_buffer().producer_of(VolatileSlot::SpectrumIntensities),
              std::string(SpectrumAcquisition::kProducerId));
}

TEST_F(SpectrumAcquisitionTest, SlotsAreReleasedOnDestruction)
{
    {
        SpectrumAcquisition first(broker);
    }
    EXPECT_FALSE(broker.volatile_buffer().producer_of(VolatileSlot::SpectrumWavelengths).has_value());
    EXPECT_FALSE(broker.volatile_buffer().producer_of(VolatileSlot::SpectrumIntensities).has_value());

    SpectrumAcquisition second(broker);
    ASSERT_TRUE(spectrometer->connect(port).is_ok());
    EXPECT_TRUE(second.acquire_once().is_ok());
}

TEST_F(SpectrumAcquisitionTest, AcquireOncePublishesBothSlots)
{
    SpectrumAcquisition acquisition(broker);
    SpectrumAnalysis analysis(broker);

    auto st = acquisition.acquire_once();
    ASSERT_TRUE(st.is_error());
    EXPECT_EQ(st.error(), ErrorKind::DeviceNotReady);
    EXPECT_FALSE(broker.volatile_buffer().is_populated(VolatileSlot::SpectrumIntensities));

    ASSERT_TRUE(spectrometer->connect(port).is_ok());
    ASSERT_TRUE(acquisition.acquire_once().is_ok());
    EXPECT_EQ(acquisition.published_count(), 1u);

    const auto wavelengths = broker.get_volatile(VolatileSlot::SpectrumWavelengths);
    const auto intensities = broker.get_volatile(VolatileSlot::SpectrumIntensities);
    ASSERT_TRUE(wavelengths && intensities);
    EXPECT_EQ(wavelengths->size(), device::SimulatedSpectrometer::kPixelCount);
    EXPECT_EQ(intensities->size(), wavelengths->size());

    // The strongest simulated band sits at 1450 nm.
    const auto peak = analysis.find_peak();
    ASSERT_TRUE(peak.has_value());
    ASSERT_TRUE(peak->wavelength_nm.has_value());
    EXPECT_NEAR(*peak->wavelength_nm, 1450.0, 60.0);
}

TEST_F(SpectrumAcquisitionTest, ContinuousStartStop)
{
    SpectrumAcquisition acquisition(broker);
    ASSERT_TRUE(spectrometer->connect(port).is_ok());

    ASSERT_TRUE(acquisition.start_continuous(std::chrono::milliseconds(5)).is_ok());
    EXPECT_TRUE(acquisition.is_running());

    auto again = acquisition.start_continuous();
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error(), ErrorKind::DeviceBusy);

    ASSERT_TRUE(test_utils::wait_until([&] { return acquisition.published_count() >= 3; }));
    acquisition.stop();
    EXPECT_FALSE(acquisition.is_running());
    const auto count = acquisition.published_count();
    std::this_thread::sleep_for(30ms);
    EXPECT_EQ(acquisition.published_count(), count);

    // Restartable after stop.
    ASSERT_TRUE(acquisition.start_continuous(std::chrono::milliseconds(5)).is_ok());
    ASSERT_TRUE(test_utils::wait_until([&] { return acquisition.published_count() > count; }));
    acquisition.stop();
}

TEST_F(SpectrumAcquisitionTest, LoopStopsOnFailureWithWarning)
{
    SpectrumAcquisition acquisition(broker);
    ASSERT_TRUE(spectrometer->connect(port).is_ok());
    ASSERT_TRUE(acquisition.start_continuous(std::chrono::milliseconds(5)).is_ok());
    ASSERT_TRUE(test_utils::wait_until([&] { return acquisition.published_count() >= 1; }));

    sim->fail_next_commands(1);
    ASSERT_TRUE(test_utils::wait_until([&] { return !acquisition.is_running(); }));

    const auto history = broker.status().history();
    const bool warned = std::any_of(history.begin(), history.end(), [](const broker::StatusMessage &m) {
        return m.severity == broker::Severity::Warning &&
               m.text.find("continuous acquisition stopped") != std::string::npos;
    });
    EXPECT_TRUE(warned);
    acquisition.stop();
    EXPECT_EQ(acquisition.start_continuous(std::chrono::milliseconds(-1)).error(), ErrorKind::Validation);
}
