#pragma once
/**
 * @file status_channel.hpp
 * @brief Headless status/log sink shared by all capabilities and modules.
 *
 * Every report is forwarded to the Logger at the matching level, recorded as
 * the "last message", kept in a bounded history and delivered to listeners.
 * Listeners are the replacement for a UI status bar: they are invoked on the
 * reporting thread, outside the channel's lock, and may report again.
 */

#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace elworkbench::broker
{

enum class Severity
{
    Info,
    Warning,
    Error,
};

const char *to_string(Severity severity) noexcept;

struct StatusMessage
{
    Severity severity;
    std::string text;
    std::chrono::system_clock::time_point timestamp;
};

class StatusChannel
{
  public:
    using Listener = std::function<void(const StatusMessage &)>;
    using ListenerId = std::size_t;

    explicit StatusChannel(std::size_t history_capacity = 256);

    StatusChannel(const StatusChannel &) = delete;
    StatusChannel &operator=(const StatusChannel &) = delete;

    void report(Severity severity, std::string text);
    void info(std::string text) { report(Severity::Info, std::move(text)); }
    void warning(std::string text) { report(Severity::Warning, std::move(text)); }
    void error(std::string text) { report(Severity::Error, std::move(text)); }

    [[nodiscard]] std::optional<StatusMessage> last_message() const;

    /// Oldest first.
    [[nodiscard]] std::vector<StatusMessage> history() const;

    ListenerId add_listener(Listener listener);
    void remove_listener(ListenerId id);

  private:
    mutable std::mutex m_mutex;
    std::size_t m_capacity;
    std::deque<StatusMessage> m_history;
    std::vector<std::pair<ListenerId, Listener>> m_listeners;
    ListenerId m_next_listener_id{1};
};

} // namespace elworkbench::broker
