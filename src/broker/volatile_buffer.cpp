#include "broker/volatile_buffer.hpp"
#include "utils/Logger.hpp"

namespace elworkbench::broker
{

const char *slot_name(VolatileSlot slot) noexcept
{
    switch (slot)
    {
    case VolatileSlot::SpectrumWavelengths: return "spectrum_wavelengths";
    case VolatileSlot::SpectrumIntensities: return "spectrum_intensities";
    case VolatileSlot::SweepX: return "sweep_x";
    case VolatileSlot::SweepY: return "sweep_y";
    }
    return "unknown";
}

std::optional<VolatileSlot> parse_slot(std::string_view name) noexcept
{
    for (std::size_t i = 0; i < kVolatileSlotCount; ++i)
    {
        const auto slot = static_cast<VolatileSlot>(i);
        if (name == slot_name(slot))
            return slot;
    }
    return std::nullopt;
}

bool VolatileBuffer::declare_producer(VolatileSlot slot, const std::string &producer)
{
    Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (s.producer)
    {
        LOGGER_WARN("VolatileBuffer: '{}' cannot claim slot '{}', already produced by '{}'",
                    producer, slot_name(slot), *s.producer);
        return false;
    }
    s.producer = producer;
    return true;
}

bool VolatileBuffer::declare_producer(std::initializer_list<VolatileSlot> slots, const std::string &producer)
{
    for (auto it = slots.begin(); it != slots.end(); ++it)
    {
        if (!declare_producer(*it, producer))
        {
            for (auto claimed = slots.begin(); claimed != it; ++claimed)
                release_producer(*claimed, producer);
            return false;
        }
    }
    return true;
}

bool VolatileBuffer::release_producer(VolatileSlot slot, const std::string &producer)
{
    Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.producer || *s.producer != producer)
        return false;
    s.producer.reset();
    return true;
}

std::optional<std::string> VolatileBuffer::producer_of(VolatileSlot slot) const
{
    const Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.producer;
}

ApiStatus VolatileBuffer::set(VolatileSlot slot, const std::string &producer,
                              std::vector<double> values)
{
    // Allocate outside the lock; readers holding the previous snapshot keep it alive.
    auto snapshot = std::make_shared<const std::vector<double>>(std::move(values));

    Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    if (!s.producer || *s.producer != producer)
    {
        return failure(ErrorKind::Validation,
                       "'" + producer + "' is not the declared producer of slot '" +
                           slot_name(slot) + "'");
    }
    s.data = std::move(snapshot);
    ++s.sequence;
    s.updated_at = std::chrono::steady_clock::now();
    return ApiStatus::ok();
}

VolatileSnapshot VolatileBuffer::get(VolatileSlot slot) const
{
    const Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.data;
}

StampedSnapshot VolatileBuffer::get_stamped(VolatileSlot slot) const
{
    const Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    return {s.data, s.sequence, s.updated_at};
}

bool VolatileBuffer::is_populated(VolatileSlot slot) const
{
    const Slot &s = slot_ref(slot);
    std::lock_guard<std::mutex> lock(s.mutex);
    return s.data != nullptr;
}

} // namespace elworkbench::broker
