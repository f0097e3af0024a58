#include "broker/status_channel.hpp"
#include "utils/Logger.hpp"

#include <algorithm>

namespace elworkbench::broker
{

using utils::Logger;

const char *to_string(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Info: return "INFO";
    case Severity::Warning: return "WARNING";
    case Severity::Error: return "ERROR";
    }
    return "UNKNOWN";
}

namespace
{
Logger::Level to_logger_level(Severity severity) noexcept
{
    switch (severity)
    {
    case Severity::Info: return Logger::Level::L_INFO;
    case Severity::Warning: return Logger::Level::L_WARNING;
    case Severity::Error: return Logger::Level::L_ERROR;
    }
    return Logger::Level::L_INFO;
}
} // namespace

StatusChannel::StatusChannel(std::size_t history_capacity)
    : m_capacity(std::max<std::size_t>(history_capacity, 1))
{
}

void StatusChannel::report(Severity severity, std::string text)
{
    Logger::instance().log_message(to_logger_level(severity), text);

    StatusMessage msg{severity, std::move(text), std::chrono::system_clock::now()};
    std::vector<Listener> listeners;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_history.push_back(msg);
        while (m_history.size() > m_capacity)
            m_history.pop_front();
        listeners.reserve(m_listeners.size());
        for (const auto &entry : m_listeners)
            listeners.push_back(entry.second);
    }

    for (const auto &listener : listeners)
    {
        try
        {
            listener(msg);
        }
        catch (const std::exception &ex)
        {
            LOGGER_ERROR("StatusChannel: listener threw while handling '{}': {}", msg.text,
                         ex.what());
        }
    }
}

std::optional<StatusMessage> StatusChannel::last_message() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_history.empty())
        return std::nullopt;
    return m_history.back();
}

std::vector<StatusMessage> StatusChannel::history() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_history.begin(), m_history.end()};
}

StatusChannel::ListenerId StatusChannel::add_listener(Listener listener)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const ListenerId id = m_next_listener_id++;
    m_listeners.emplace_back(id, std::move(listener));
    return id;
}

void StatusChannel::remove_listener(ListenerId id)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::erase_if(m_listeners, [id](const auto &entry) { return entry.first == id; });
}

} // namespace elworkbench::broker
