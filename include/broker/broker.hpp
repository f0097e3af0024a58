#pragma once
/**
 * @file broker.hpp
 * @brief The dependency-injection root handed to every consumer module.
 *
 * The Broker maps capability names to Capability API instances and owns the
 * volatile buffer and the status channel. It is created once by the
 * bootstrap, passed by reference, and destroyed at shutdown. Registration
 * happens during bootstrap; lookups afterwards are read-only and only hold
 * the registry lock for the duration of the map access.
 */

#include "broker/capability_api.hpp"
#include "broker/errors.hpp"
#include "broker/status_channel.hpp"
#include "broker/volatile_buffer.hpp"

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace elworkbench::broker
{

class Broker
{
  public:
    explicit Broker(std::size_t status_history = 256);
    ~Broker();

    Broker(const Broker &) = delete;
    Broker &operator=(const Broker &) = delete;

    /**
     * @brief Bind @p api under @p name.
     * @throws DuplicateRegistrationError if @p name is already bound.
     * @throws std::invalid_argument if @p api is null.
     */
    void register_capability(const std::string &name, std::shared_ptr<CapabilityApi> api);

    /// Binds under `api->name()`.
    void register_capability(std::shared_ptr<CapabilityApi> api);

    /**
     * @throws CapabilityNotFoundError if nothing is bound under @p name.
     */
    [[nodiscard]] std::shared_ptr<CapabilityApi> get_capability(const std::string &name) const;

    /**
     * @brief Lookup and downcast in one step.
     * @throws CapabilityNotFoundError if missing or bound to a different type.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> get_capability_as(const std::string &name) const
    {
        auto typed = std::dynamic_pointer_cast<T>(get_capability(name));
        if (!typed)
            throw CapabilityNotFoundError(name, "is bound to a different capability type");
        return typed;
    }

    [[nodiscard]] bool has_capability(const std::string &name) const;

    /// Sorted.
    [[nodiscard]] std::vector<std::string> capability_names() const;

    [[nodiscard]] VolatileSnapshot get_volatile(VolatileSlot slot) const;
    ApiStatus set_volatile(VolatileSlot slot, const std::string &producer,
                           std::vector<double> values);

    [[nodiscard]] VolatileBuffer &volatile_buffer() noexcept { return m_volatile; }
    [[nodiscard]] const VolatileBuffer &volatile_buffer() const noexcept { return m_volatile; }
    [[nodiscard]] StatusChannel &status() noexcept { return m_status; }

  private:
    // Declared first so they outlive the capabilities, which report status while closing.
    VolatileBuffer m_volatile;
    StatusChannel m_status;

    mutable std::shared_mutex m_registry_mutex;
    std::unordered_map<std::string, std::shared_ptr<CapabilityApi>> m_capabilities;
};

} // namespace elworkbench::broker
