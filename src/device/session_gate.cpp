#include "device/session_gate.hpp"
#include "utils/Logger.hpp"

#include <fmt/format.h>

namespace elworkbench::device
{

using broker::ApiResult;
using broker::ErrorKind;

void SessionGate::Ticket::release() noexcept
{
    if (m_gate != nullptr)
    {
        m_gate->unlock();
        m_gate = nullptr;
    }
}

SessionGate::SessionGate(SessionGatePolicy policy) : m_policy(policy) {}

ApiResult<SessionGate::Ticket> SessionGate::acquire(const std::string &what)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_held)
    {
        m_held = true;
        return ApiResult<Ticket>::ok(Ticket(this));
    }

    if (m_waiting >= m_policy.max_waiters)
    {
        LOGGER_DEBUG("SessionGate: rejecting '{}', {} callers already waiting", what, m_waiting);
        return broker::failure<Ticket>(
            ErrorKind::DeviceBusy,
            fmt::format("{}: device session busy ({} callers already queued)", what, m_waiting));
    }

    ++m_waiting;
    const bool acquired = m_cv.wait_for(lock, m_policy.acquire_timeout, [this] { return !m_held; });
    --m_waiting;
    if (!acquired)
    {
        return broker::failure<Ticket>(
            ErrorKind::DeviceBusy,
            fmt::format("{}: device session still busy after {} ms", what,
                        m_policy.acquire_timeout.count()));
    }
    m_held = true;
    return ApiResult<Ticket>::ok(Ticket(this));
}

bool SessionGate::is_held() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_held;
}

std::size_t SessionGate::waiting() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_waiting;
}

void SessionGate::unlock() noexcept
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_held = false;
    }
    m_cv.notify_one();
}

} // namespace elworkbench::device
