#include "api/device_capability.hpp"
#include "broker/broker.hpp"

namespace elworkbench::api
{

using broker::ApiResult;
using broker::ApiStatus;
using broker::ErrorKind;

DeviceCapabilityApi::DeviceCapabilityApi(std::string name, broker::Broker &broker, device::DeviceAdapter &device,
                                         device::SessionGatePolicy policy)
    : CapabilityApi(std::move(name), broker), m_device(device), m_gate(policy)
{
}

ApiResult<device::SessionGate::Ticket> DeviceCapabilityApi::take_session(const char *what)
{
    auto ticket = m_gate.acquire(what);
    if (ticket.is_error())
        status().warning(fmt::format("[{}] {}", name(), ticket.message()));
    return ticket;
}

ApiStatus DeviceCapabilityApi::open_session(const std::string &port)
{
    if (port.empty())
        return broker::failure(ErrorKind::Validation, "port must not be empty");
    try
    {
        m_device.connect(port);
    }
    catch (const broker::DeviceCommunicationError &ex)
    {
        return broker::failure(ErrorKind::DeviceCommunication, ex.what());
    }
    return ApiStatus::ok();
}

ApiStatus DeviceCapabilityApi::disconnect()
{
    std::string port;
    auto st = with_session<void>("disconnect", [&] {
        port = m_device.port();
        m_device.disconnect();
        return ApiStatus::ok();
    });
    if (st.is_error())
        return st;
    if (!port.empty())
        status().info(fmt::format("[{}] disconnected from {}", name(), port));
    return ApiStatus::ok();
}

} // namespace elworkbench::api
