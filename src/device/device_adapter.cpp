#include "device/device_adapter.hpp"
#include "utils/Logger.hpp"

#include <algorithm>
#include <set>

namespace elworkbench::device
{

using broker::DeviceCommunicationError;
using broker::DeviceNotReadyError;

const char *to_string(ConnectionState state) noexcept
{
    switch (state)
    {
    case ConnectionState::Disconnected: return "DISCONNECTED";
    case ConnectionState::Connecting: return "CONNECTING";
    case ConnectionState::Connected: return "CONNECTED";
    case ConnectionState::Faulted: return "FAULTED";
    }
    return "UNKNOWN";
}

namespace
{
// Ports with a live session in this process.
std::mutex g_claimed_ports_mutex;
std::set<std::string> g_claimed_ports;

bool claim_port(const std::string &port)
{
    std::lock_guard<std::mutex> lock(g_claimed_ports_mutex);
    return g_claimed_ports.insert(port).second;
}

void release_port(const std::string &port) noexcept
{
    std::lock_guard<std::mutex> lock(g_claimed_ports_mutex);
    g_claimed_ports.erase(port);
}
} // namespace

DeviceAdapter::DeviceAdapter(std::string device_class, unsigned max_consecutive_failures)
    : m_device_class(std::move(device_class)),
      m_max_failures(std::max(1u, max_consecutive_failures))
{
}

DeviceAdapter::~DeviceAdapter()
{
    // do_close() is no longer dispatchable here; only the port claim can be undone.
    std::lock_guard<std::mutex> lock(m_session_mutex);
    if (!m_port.empty())
    {
        LOGGER_WARN("{}: destroyed while holding port '{}'", m_device_class, m_port);
        release_port(m_port);
    }
}

std::string DeviceAdapter::port() const
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    return m_port;
}

void DeviceAdapter::connect(const std::string &port)
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    if (!m_port.empty())
        close_locked();

    if (!claim_port(port))
        throw DeviceCommunicationError("port '" + port + "' already has a live session");

    m_state.store(ConnectionState::Connecting);
    try
    {
        do_open(port);
    }
    catch (const std::exception &ex)
    {
        release_port(port);
        m_state.store(ConnectionState::Disconnected);
        LOGGER_ERROR("{}: failed to open '{}': {}", m_device_class, port, ex.what());
        throw DeviceCommunicationError("cannot open '" + port + "': " + ex.what());
    }

    m_port = port;
    m_failures.store(0);
    m_state.store(ConnectionState::Connected);
    LOGGER_INFO("{}: connected on '{}'", m_device_class, port);
}

void DeviceAdapter::disconnect() noexcept
{
    std::lock_guard<std::mutex> lock(m_session_mutex);
    close_locked();
}

void DeviceAdapter::close_locked() noexcept
{
    if (m_port.empty())
    {
        m_state.store(ConnectionState::Disconnected);
        return;
    }
    do_close();
    release_port(m_port);
    LOGGER_INFO("{}: disconnected from '{}'", m_device_class, m_port);
    m_port.clear();
    m_failures.store(0);
    m_state.store(ConnectionState::Disconnected);
}

void DeviceAdapter::mark_faulted(const std::string &reason) noexcept
{
    auto expected = ConnectionState::Connected;
    if (m_state.compare_exchange_strong(expected, ConnectionState::Faulted))
        LOGGER_ERROR("{}: session FAULTED: {}", m_device_class, reason);
}

void DeviceAdapter::ensure_ready(const char *operation) const
{
    const auto current = state();
    if (current != ConnectionState::Connected)
    {
        throw DeviceNotReadyError(fmt::format("{}: cannot {} while {}", m_device_class, operation,
                                              to_string(current)));
    }
}

void DeviceAdapter::record_success() noexcept
{
    m_failures.store(0);
}

void DeviceAdapter::record_failure(const char *operation, const char *what) noexcept
{
    const unsigned failures = m_failures.fetch_add(1) + 1;
    LOGGER_WARN("{}: {} failed ({} in a row): {}", m_device_class, operation, failures, what);
    if (failures >= m_max_failures)
        mark_faulted(fmt::format("{} consecutive communication failures", failures));
}

} // namespace elworkbench::device
