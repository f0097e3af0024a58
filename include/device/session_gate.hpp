#pragma once
/**
 * @file session_gate.hpp
 * @brief Serializes command sequences on one device session.
 *
 * One holder at a time. Up to `max_waiters` callers may block for the
 * session; a caller arriving when the wait queue is full, or one that waits
 * longer than `acquire_timeout`, is turned away with ErrorKind::DeviceBusy.
 * Waiters are woken in no particular order.
 */

#include "broker/errors.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace elworkbench::device
{

struct SessionGatePolicy
{
    std::size_t max_waiters{4};
    std::chrono::milliseconds acquire_timeout{2000};
};

class SessionGate
{
  public:
    /// Holding a Ticket means owning the session; releasing happens on destruction.
    class Ticket
    {
      public:
        Ticket(Ticket &&other) noexcept : m_gate(other.m_gate) { other.m_gate = nullptr; }
        Ticket &operator=(Ticket &&other) noexcept
        {
            if (this != &other)
            {
                release();
                m_gate = other.m_gate;
                other.m_gate = nullptr;
            }
            return *this;
        }
        Ticket(const Ticket &) = delete;
        Ticket &operator=(const Ticket &) = delete;
        ~Ticket() { release(); }

        void release() noexcept;

      private:
        friend class SessionGate;
        explicit Ticket(SessionGate *gate) noexcept : m_gate(gate) {}

        SessionGate *m_gate;
    };

    explicit SessionGate(SessionGatePolicy policy = {});

    SessionGate(const SessionGate &) = delete;
    SessionGate &operator=(const SessionGate &) = delete;

    /**
     * @brief Take the session, waiting up to the policy timeout.
     * @return the ticket, or a DeviceBusy failure (queue full or timed out).
     */
    [[nodiscard]] broker::ApiResult<Ticket> acquire(const std::string &what);

    [[nodiscard]] bool is_held() const;
    [[nodiscard]] std::size_t waiting() const;
    [[nodiscard]] const SessionGatePolicy &policy() const noexcept { return m_policy; }

  private:
    void unlock() noexcept;

    const SessionGatePolicy m_policy;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_held{false};
    std::size_t m_waiting{0};
};

} // namespace elworkbench::device
