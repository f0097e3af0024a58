/*******************************************************************************
 * @file Logger.hpp
 * @brief Asynchronous, thread-safe logging utility.
 *
 * **Design: Command-Queue Pattern**
 * Logging latency must not stall instrument or acquisition threads, so the
 * Logger decouples formatting from I/O:
 *
 * 1.  **Non-Blocking API**: `LOGGER_INFO(...)` and friends format the message on
 *     the calling thread and push a command onto a queue. Configuration changes
 *     (switching to a file, installing an error callback) are commands too, so
 *     they are applied in call order.
 * 2.  **Worker Thread**: a single background thread is the sole consumer of the
 *     queue and the only thread touching the active sink.
 * 3.  **Sinks**: `ConsoleSink` (stderr) and `FileSink` (append-only file). The
 *     workbench writes one file per session, see `app::setup_session_log`.
 * 4.  **Robustness**: `flush()` is a barrier that waits until everything queued
 *     before it has been written; `shutdown()` drains the queue and joins the
 *     worker. I/O errors are reported through an optional callback which runs
 *     on its own dispatcher thread, so a callback may log without deadlocking.
 *
 * **Usage**
 * ```cpp
 * #include "utils/Logger.hpp"
 * LOGGER_INFO("Connected to {} on {}", model, port);
 *
 * Logger &logger = Logger::instance();
 * logger.set_logfile("data/logs/2025-01-01_12-00-00.log");
 * logger.set_level(Logger::Level::L_DEBUG);
 *
 * logger.shutdown(); // Blocks until all logs are written
 * ```
 ******************************************************************************/

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "elworkbench_utils_export.h"

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace elworkbench::utils
{

struct Impl;

class ELWORKBENCH_UTILS_EXPORT Logger
{
  public:
    enum class Level : int
    {
        L_TRACE = 0,
        L_DEBUG = 1,
        L_INFO = 2,
        L_WARNING = 3,
        L_ERROR = 4,
        L_SYSTEM = 5,
    };

    static Logger &instance();

    Logger(const Logger &) = delete;
    Logger &operator=(const Logger &) = delete;
    Logger(Logger &&) = delete;
    Logger &operator=(Logger &&) = delete;

    ~Logger();

    // --- Sinks ---
    // Sink changes are asynchronous commands executed in order by the worker.

    /** @brief Switch logging to the console (stderr). Non-blocking. */
    void set_console();

    /**
     * @brief Switch logging to a file, appending. Non-blocking.
     * @param utf8_path Path to the log file. Parent directories must exist.
     *
     * If the file cannot be opened the current sink stays active and the
     * write-error callback (if any) receives the reason.
     */
    void set_logfile(const std::string &utf8_path);

    /**
     * @brief Drains the queue and stops the worker thread.
     *
     * Must be called before main() returns; later log calls fall back to stderr.
     */
    void shutdown();

    /** @brief Blocks until every message queued before this call has been written. */
    void flush();

    void set_level(Level lvl);
    Level level() const;

    /**
     * @brief Sets a callback invoked on sink creation or write errors.
     *
     * The callback runs on a dedicated dispatcher thread, never on the worker.
     */
    void set_write_error_callback(std::function<void(const std::string &)> cb);

    /// "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "SYSTEM".
    static const char *level_name(Level lvl) noexcept;

    /// Case-insensitive inverse of level_name(); also accepts "WARNING".
    static std::optional<Level> parse_level(std::string_view name) noexcept;

    // --- Formatting API (header-only templates) ---
    template <Level lvl, typename... Args>
    void log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept;

    template <typename... Args>
    void trace_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_TRACE>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_DEBUG>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_INFO>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_WARNING>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_ERROR>(fmt_str, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void system_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
    {
        log_fmt<Level::L_SYSTEM>(fmt_str, std::forward<Args>(args)...);
    }

    /// Enqueues an already formatted message at a level chosen at runtime.
    void log_message(Level lvl, std::string body) noexcept;

  private:
    Logger();

    std::unique_ptr<Impl> pImpl;

    void enqueue_log(Level lvl, std::string &&body) noexcept;
    bool should_log(Level lvl) const noexcept;
};

#ifndef LOGGER_COMPILE_LEVEL
#define LOGGER_COMPILE_LEVEL 0 // 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error
#endif

template <Logger::Level lvl, typename... Args>
void Logger::log_fmt(fmt::format_string<Args...> fmt_str, Args &&...args) noexcept
{
    if constexpr (static_cast<int>(lvl) >= LOGGER_COMPILE_LEVEL)
    {
        if (!should_log(lvl))
            return;

        try
        {
            enqueue_log(lvl, fmt::format(fmt_str, std::forward<Args>(args)...));
        }
        catch (const std::exception &ex)
        {
            enqueue_log(lvl, std::string("[FORMAT ERROR] ") + ex.what());
        }
    }
}

} // namespace elworkbench::utils

#if defined(_MSC_VER)
#pragma warning(pop)
#endif

#define LOGGER_TRACE(fmt, ...)                                                                     \
    ::elworkbench::utils::Logger::instance().trace_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_DEBUG(fmt, ...)                                                                     \
    ::elworkbench::utils::Logger::instance().debug_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_INFO(fmt, ...)                                                                      \
    ::elworkbench::utils::Logger::instance().info_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_WARN(fmt, ...)                                                                      \
    ::elworkbench::utils::Logger::instance().warn_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_ERROR(fmt, ...)                                                                     \
    ::elworkbench::utils::Logger::instance().error_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
#define LOGGER_SYSTEM(fmt, ...)                                                                    \
    ::elworkbench::utils::Logger::instance().system_fmt(FMT_STRING(fmt) __VA_OPT__(, ) __VA_ARGS__)
