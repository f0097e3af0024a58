#include "broker/broker.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>

namespace elworkbench::broker
{

Broker::Broker(std::size_t status_history) : m_status(status_history) {}

Broker::~Broker()
{
    std::unordered_map<std::string, std::shared_ptr<CapabilityApi>> released;
    {
        std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
        released.swap(m_capabilities);
    }
    // Capabilities close their sessions here, while the status channel is still alive.
    released.clear();
}

void Broker::register_capability(const std::string &name, std::shared_ptr<CapabilityApi> api)
{
    if (!api)
        throw std::invalid_argument("Broker::register_capability: null capability for '" + name + "'");

    {
        std::unique_lock<std::shared_mutex> lock(m_registry_mutex);
        if (m_capabilities.count(name) != 0)
            throw DuplicateRegistrationError(name);
        m_capabilities.emplace(name, std::move(api));
    }
    LOGGER_INFO("Broker: registered capability '{}'", name);
}

void Broker::register_capability(std::shared_ptr<CapabilityApi> api)
{
    if (!api)
        throw std::invalid_argument("Broker::register_capability: null capability");
    const std::string name = api->name();
    register_capability(name, std::move(api));
}

std::shared_ptr<CapabilityApi> Broker::get_capability(const std::string &name) const
{
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    auto it = m_capabilities.find(name);
    if (it == m_capabilities.end())
        throw CapabilityNotFoundError(name);
    return it->second;
}

bool Broker::has_capability(const std::string &name) const
{
    std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
    return m_capabilities.count(name) != 0;
}

std::vector<std::string> Broker::capability_names() const
{
    std::vector<std::string> names;
    {
        std::shared_lock<std::shared_mutex> lock(m_registry_mutex);
        names.reserve(m_capabilities.size());
        for (const auto &[name, api] : m_capabilities)
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

VolatileSnapshot Broker::get_volatile(VolatileSlot slot) const
{
    return m_volatile.get(slot);
}

ApiStatus Broker::set_volatile(VolatileSlot slot, const std::string &producer,
                               std::vector<double> values)
{
    auto result = m_volatile.set(slot, producer, std::move(values));
    if (result.is_error())
        m_status.warning(result.message());
    return result;
}

} // namespace elworkbench::broker
