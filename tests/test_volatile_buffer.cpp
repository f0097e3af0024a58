// tests/test_volatile_buffer.cpp

#include "test_preamble.h"

#include "broker/volatile_buffer.hpp"

using namespace elworkbench::broker;

TEST(VolatileBufferTest, EmptyUntilFirstSet)
{
    VolatileBuffer buffer;
    EXPECT_EQ(buffer.get(VolatileSlot::SpectrumIntensities), nullptr);
    EXPECT_FALSE(buffer.is_populated(VolatileSlot::SpectrumIntensities));
    EXPECT_EQ(buffer.get_stamped(VolatileSlot::SpectrumIntensities).sequence, 0u);

    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SpectrumIntensities, "spectrum_acquisition"));
    ASSERT_TRUE(buffer.set(VolatileSlot::SpectrumIntensities, "spectrum_acquisition", {0.1, 0.9, 0.2}).is_ok());

    auto snap = buffer.get(VolatileSlot::SpectrumIntensities);
    ASSERT_NE(snap, nullptr);
    EXPECT_EQ(*snap, (std::vector<double>{0.1, 0.9, 0.2}));
    EXPECT_EQ(buffer.get_stamped(VolatileSlot::SpectrumIntensities).sequence, 1u);
    // Other slots are unaffected.
    EXPECT_FALSE(buffer.is_populated(VolatileSlot::SweepX));
}

TEST(VolatileBufferTest, SnapshotSurvivesOverwrite)
{
    VolatileBuffer buffer;
    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SweepX, "sweep_runner"));
    ASSERT_TRUE(buffer.set(VolatileSlot::SweepX, "sweep_runner", {1.0, 2.0}).is_ok());
    auto first = buffer.get(VolatileSlot::SweepX);

    ASSERT_TRUE(buffer.set(VolatileSlot::SweepX, "sweep_runner", {3.0}).is_ok());
    EXPECT_EQ(*first, (std::vector<double>{1.0, 2.0}));
    EXPECT_EQ(*buffer.get(VolatileSlot::SweepX), (std::vector<double>{3.0}));

    // An empty vector is a populated slot, not an EMPTY one.
    ASSERT_TRUE(buffer.set(VolatileSlot::SweepX, "sweep_runner", {}).is_ok());
    ASSERT_TRUE(buffer.is_populated(VolatileSlot::SweepX));
    EXPECT_TRUE(buffer.get(VolatileSlot::SweepX)->empty());
}

TEST(VolatileBufferTest, OnlyDeclaredProducerMayWrite)
{
    VolatileBuffer buffer;
    auto undeclared = buffer.set(VolatileSlot::SweepY, "anyone", {1.0});
    ASSERT_TRUE(undeclared.is_error());
    EXPECT_EQ(undeclared.error(), ErrorKind::Validation);

    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SweepY, "sweep_runner"));
    // A second declaration is refused even under the same id.
    EXPECT_FALSE(buffer.declare_producer(VolatileSlot::SweepY, "sweep_runner"));
    EXPECT_FALSE(buffer.declare_producer(VolatileSlot::SweepY, "intruder"));
    EXPECT_EQ(buffer.producer_of(VolatileSlot::SweepY), "sweep_runner");

    auto foreign = buffer.set(VolatileSlot::SweepY, "intruder", {9.0});
    ASSERT_TRUE(foreign.is_error());
    EXPECT_EQ(foreign.error(), ErrorKind::Validation);
    EXPECT_FALSE(buffer.is_populated(VolatileSlot::SweepY));
}

TEST(VolatileBufferTest, MultiSlotClaimIsAllOrNothing)
{
    VolatileBuffer buffer;
    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SweepY, "other"));

    EXPECT_FALSE(buffer.declare_producer({VolatileSlot::SweepX, VolatileSlot::SweepY}, "sweep_runner"));
    EXPECT_FALSE(buffer.producer_of(VolatileSlot::SweepX).has_value());
    EXPECT_EQ(buffer.producer_of(VolatileSlot::SweepY), "other");

    EXPECT_TRUE(buffer.declare_producer({VolatileSlot::SpectrumWavelengths, VolatileSlot::SpectrumIntensities},
                                        "spectrum_acquisition"));
    EXPECT_EQ(buffer.producer_of(VolatileSlot::SpectrumIntensities), "spectrum_acquisition");
}

TEST(VolatileBufferTest, ReleaseFreesTheSlotAndKeepsContent)
{
    VolatileBuffer buffer;
    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SweepX, "first"));
    ASSERT_TRUE(buffer.set(VolatileSlot::SweepX, "first", {1.0}).is_ok());

    EXPECT_FALSE(buffer.release_producer(VolatileSlot::SweepX, "second"));
    EXPECT_TRUE(buffer.release_producer(VolatileSlot::SweepX, "first"));
    EXPECT_FALSE(buffer.producer_of(VolatileSlot::SweepX).has_value());
    EXPECT_EQ(*buffer.get(VolatileSlot::SweepX), (std::vector<double>{1.0}));
    EXPECT_TRUE(buffer.set(VolatileSlot::SweepX, "first", {2.0}).is_error());

    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SweepX, "second"));
    EXPECT_TRUE(buffer.set(VolatileSlot::SweepX, "second", {2.0}).is_ok());
}

TEST(VolatileBufferTest, SlotNamesRoundTrip)
{
    for (std::size_t i = 0; i < kVolatileSlotCount; ++i)
    {
        const auto slot = static_cast<VolatileSlot>(i);
        EXPECT_EQ(parse_slot(slot_name(slot)), slot);
    }
    EXPECT_EQ(std::string(slot_name(VolatileSlot::SpectrumWavelengths)), "spectrum_wavelengths");
    EXPECT_FALSE(parse_slot("temperature").has_value());
}

TEST(VolatileBufferTest, ReadersNeverSeeTornSnapshots)
{
    VolatileBuffer buffer;
    ASSERT_TRUE(buffer.declare_producer(VolatileSlot::SpectrumIntensities, "writer"));

    std::atomic<bool> done{false};
    std::thread writer([&] {
        for (int i = 1; i <= 500; ++i)
            ASSERT_TRUE(buffer.set(VolatileSlot::SpectrumIntensities, "writer",
                                   std::vector<double>(64, static_cast<double>(i)))
                            .is_ok());
        done.store(true);
    });

    while (!done.load())
    {
        auto snap = buffer.get(VolatileSlot::SpectrumIntensities);
        if (!snap)
            continue;
        ASSERT_EQ(snap->size(), 64u);
        const double first = snap->front();
        for (double v : *snap)
            ASSERT_EQ(v, first);
    }
    writer.join();
    EXPECT_EQ(buffer.get_stamped(VolatileSlot::SpectrumIntensities).sequence, 500u);
}
