#pragma once
/**
 * @file device_adapter.hpp
 * @brief Base class of the thin wrappers around physical instrument command sets.
 *
 * State machine:
 *
 *   DISCONNECTED -> CONNECTING -> CONNECTED -> DISCONNECTED   (disconnect / failed open)
 *   CONNECTED -> FAULTED -> DISCONNECTED                      (repeated failures, then disconnect)
 *
 * Every primitive command of a derived adapter runs through guarded(): it
 * refuses to run outside CONNECTED (DeviceNotReadyError), counts consecutive
 * DeviceCommunicationErrors and moves the adapter to FAULTED once the count
 * reaches the configured threshold. A FAULTED adapter must be reconnected.
 *
 * A port can be held by one live adapter in the whole process; a second
 * connect() to the same port fails until the first adapter disconnects.
 *
 * Commands are not internally serialized; the owning capability API runs at
 * most one command sequence at a time (see SessionGate).
 */

#include "broker/errors.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <type_traits>

namespace elworkbench::device
{

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected,
    Faulted,
};

const char *to_string(ConnectionState state) noexcept;

class DeviceAdapter
{
  public:
    /**
     * @param device_class short label used in logs, e.g. "Keithley 2602 (simulated)".
     * @param max_consecutive_failures communication failures in a row before FAULTED (min 1).
     */
    explicit DeviceAdapter(std::string device_class, unsigned max_consecutive_failures = 3);

    /// Derived classes must call disconnect() in their own destructor.
    virtual ~DeviceAdapter();

    DeviceAdapter(const DeviceAdapter &) = delete;
    DeviceAdapter &operator=(const DeviceAdapter &) = delete;

    /**
     * @brief Open a session on @p port.
     *
     * Connecting while CONNECTED or FAULTED closes the current session first.
     * @throws broker::DeviceCommunicationError if the port is held by another
     *         adapter or the instrument cannot be opened; the adapter is then
     *         DISCONNECTED.
     */
    void connect(const std::string &port);

    /// Close the session (if any) and release the port. Never throws.
    void disconnect() noexcept;

    /// Force FAULTED, e.g. when a safety command in an abort path failed.
    void mark_faulted(const std::string &reason) noexcept;

    [[nodiscard]] ConnectionState state() const noexcept { return m_state.load(); }
    [[nodiscard]] bool is_ready() const noexcept { return state() == ConnectionState::Connected; }
    [[nodiscard]] std::string port() const;
    [[nodiscard]] const std::string &device_class() const noexcept { return m_device_class; }
    [[nodiscard]] unsigned consecutive_failures() const noexcept { return m_failures.load(); }

  protected:
    /**
     * @brief Run one primitive command with state checking and fault accounting.
     * @throws broker::DeviceNotReadyError if not CONNECTED.
     * @throws broker::DeviceCommunicationError rethrown from @p fn.
     */
    template <typename F>
    auto guarded(const char *operation, F &&fn)
    {
        ensure_ready(operation);
        try
        {
            if constexpr (std::is_void_v<decltype(fn())>)
            {
                fn();
                record_success();
            }
            else
            {
                auto result = fn();
                record_success();
                return result;
            }
        }
        catch (const broker::DeviceCommunicationError &ex)
        {
            record_failure(operation, ex.what());
            throw;
        }
    }

  private:
    virtual void do_open(const std::string &port) = 0;
    virtual void do_close() noexcept = 0;

    void ensure_ready(const char *operation) const;
    void record_success() noexcept;
    void record_failure(const char *operation, const char *what) noexcept;
    void close_locked() noexcept;

    const std::string m_device_class;
    const unsigned m_max_failures;

    mutable std::mutex m_session_mutex; // connect/disconnect and m_port
    std::string m_port;
    std::atomic<ConnectionState> m_state{ConnectionState::Disconnected};
    std::atomic<unsigned> m_failures{0};
};

} // namespace elworkbench::device
