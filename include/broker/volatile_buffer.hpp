#pragma once
/**
 * @file volatile_buffer.hpp
 * @brief Overwrite-in-place slots for high-rate transient data.
 *
 * The slot set is closed and enumerated. Each slot has at most one declared
 * producer; `set` from any other producer id is rejected. A declaration holds
 * until the producer releases it, and a second declaration is refused even
 * under the same id. Readers get an
 * immutable snapshot (`shared_ptr<const vector<double>>`) that stays valid
 * and unchanged while the producer keeps overwriting the slot.
 *
 * Per slot: EMPTY until the first accepted `set`, POPULATED afterwards. There
 * is no clear operation. Reading an EMPTY slot yields a null snapshot.
 */

#include "broker/errors.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace elworkbench::broker
{

enum class VolatileSlot : std::size_t
{
    SpectrumWavelengths = 0,
    SpectrumIntensities,
    SweepX,
    SweepY,
};

inline constexpr std::size_t kVolatileSlotCount = 4;

/// "spectrum_wavelengths", "spectrum_intensities", "sweep_x", "sweep_y".
const char *slot_name(VolatileSlot slot) noexcept;
std::optional<VolatileSlot> parse_slot(std::string_view name) noexcept;

using VolatileSnapshot = std::shared_ptr<const std::vector<double>>;

/// Snapshot plus bookkeeping; `sequence` is 0 while the slot is EMPTY.
struct StampedSnapshot
{
    VolatileSnapshot data;
    std::uint64_t sequence{0};
    std::chrono::steady_clock::time_point updated_at{};
};

class VolatileBuffer
{
  public:
    VolatileBuffer() = default;
    VolatileBuffer(const VolatileBuffer &) = delete;
    VolatileBuffer &operator=(const VolatileBuffer &) = delete;

    /**
     * @brief Bind @p producer as the only writer of @p slot.
     * @return false if the slot already has a producer, whatever its id. The
     *         existing declaration is kept.
     */
    bool declare_producer(VolatileSlot slot, const std::string &producer);

    /// Claims every slot in @p slots or, on the first refusal, none of them.
    bool declare_producer(std::initializer_list<VolatileSlot> slots, const std::string &producer);

    /**
     * @brief Give up the declaration so another producer can claim the slot.
     *
     * The current content stays readable.
     * @return false if @p producer is not the declared producer.
     */
    bool release_producer(VolatileSlot slot, const std::string &producer);

    [[nodiscard]] std::optional<std::string> producer_of(VolatileSlot slot) const;

    /**
     * @brief Replace the slot content.
     * @return Validation failure when @p producer is not the declared producer.
     */
    ApiStatus set(VolatileSlot slot, const std::string &producer, std::vector<double> values);

    /// Latest snapshot, or nullptr while EMPTY.
    [[nodiscard]] VolatileSnapshot get(VolatileSlot slot) const;
    [[nodiscard]] StampedSnapshot get_stamped(VolatileSlot slot) const;
    [[nodiscard]] bool is_populated(VolatileSlot slot) const;

  private:
    struct Slot
    {
        mutable std::mutex mutex;
        std::optional<std::string> producer;
        VolatileSnapshot data;
        std::uint64_t sequence{0};
        std::chrono::steady_clock::time_point updated_at{};
    };

    Slot &slot_ref(VolatileSlot slot) { return m_slots[static_cast<std::size_t>(slot)]; }
    const Slot &slot_ref(VolatileSlot slot) const { return m_slots[static_cast<std::size_t>(slot)]; }

    std::array<Slot, kVolatileSlotCount> m_slots;
};

} // namespace elworkbench::broker
