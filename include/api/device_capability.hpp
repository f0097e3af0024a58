#pragma once
/**
 * @file device_capability.hpp
 * @brief Shared session handling of the instrument capabilities.
 *
 * A DeviceCapabilityApi serializes command sequences on its adapter through a
 * SessionGate and turns adapter exceptions into reported failures. Derived
 * APIs own the adapter and pass a reference to it here.
 */

#include "broker/capability_api.hpp"
#include "device/device_adapter.hpp"
#include "device/session_gate.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace elworkbench::api
{

class DeviceCapabilityApi : public broker::CapabilityApi
{
  public:
    [[nodiscard]] device::ConnectionState state() const noexcept { return m_device.state(); }

    /// Closes the session. DeviceBusyError while a command sequence holds it.
    broker::ApiStatus disconnect();

  protected:
    DeviceCapabilityApi(std::string name, broker::Broker &broker, device::DeviceAdapter &device,
                        device::SessionGatePolicy policy);

    /**
     * @brief Run @p sequence holding the session.
     *
     * Fails with DeviceNotReady before taking the gate when the adapter is not
     * CONNECTED. Otherwise behaves as with_session().
     */
    template <typename T, typename F>
    broker::ApiResult<T> run_sequence(const char *what, F &&sequence)
    {
        if (!m_device.is_ready())
        {
            return report_failure<T>(broker::ErrorKind::DeviceNotReady,
                                     fmt::format("cannot {}: {} is {}", what, m_device.device_class(),
                                                 device::to_string(m_device.state())));
        }
        return with_session<T>(what, std::forward<F>(sequence));
    }

    /**
     * @brief Take the gate, run @p sequence, release the gate, then report.
     *
     * @p sequence returns failures built with broker::failure() and must not
     * publish status itself. Adapter exceptions it throws become failures.
     * A failure is published only after the gate is released, so status
     * listeners may issue commands on this session. DeviceBusy when the gate
     * cannot be taken.
     */
    template <typename T, typename F>
    broker::ApiResult<T> with_session(const char *what, F &&sequence)
    {
        auto ticket = take_session(what);
        if (ticket.is_error())
            return broker::ApiResult<T>::error(ticket.error(), ticket.message());

        auto result = [&]() -> broker::ApiResult<T> {
            try
            {
                return sequence();
            }
            catch (const broker::DeviceNotReadyError &ex)
            {
                return broker::failure<T>(broker::ErrorKind::DeviceNotReady, ex.what());
            }
            catch (const broker::DeviceCommunicationError &ex)
            {
                return broker::failure<T>(broker::ErrorKind::DeviceCommunication,
                                          fmt::format("{}: {}", what, ex.what()));
            }
        }();
        ticket.content().release();

        if (result.is_error())
            publish_failure(result.error(), result.message());
        return result;
    }

    /// Take the gate; a DeviceBusy failure is reported on the status channel.
    broker::ApiResult<device::SessionGate::Ticket> take_session(const char *what);

    /**
     * @brief Open the adapter session on @p port. The caller holds the gate.
     * @return Validation failure for an empty port, DeviceCommunication failure
     *         if the port is taken or does not open. Nothing is published.
     */
    broker::ApiStatus open_session(const std::string &port);

    /// Dereference a constructor argument; null is a wiring fault.
    template <typename Adapter>
    static Adapter &require_adapter(const std::unique_ptr<Adapter> &adapter)
    {
        if (!adapter)
            throw std::invalid_argument("capability constructed without a device adapter");
        return *adapter;
    }

  private:
    device::DeviceAdapter &m_device;
    device::SessionGate m_gate;
};

} // namespace elworkbench::api
