/*******************************************************************************
 * @file Logger.cpp
 * @brief Implementation of the asynchronous logger.
 *
 * @see include/utils/Logger.hpp
 *
 * **Implementation Details**
 *
 * 1.  **Commands**: `Command` is a `std::variant` of `LogMessage`,
 *     `SetSinkCommand`, `SinkCreationErrorCommand`, `FlushCommand` and
 *     `SetErrorCallbackCommand`. Public calls build a command and enqueue it.
 *
 * 2.  **Worker (`worker_loop`)**: sleeps on a condition variable, swaps the
 *     whole queue into a local vector under the lock and processes the batch
 *     with `std::visit` outside of it.
 *
 * 3.  **Sinks**: created on the calling thread so that open failures surface
 *     as a `SinkCreationErrorCommand` instead of a silent switch. The worker
 *     writes a SYSTEM line to both the old and the new sink on every switch.
 *
 * 4.  **Error callback (`CallbackDispatcher`)**: user callbacks are posted to a
 *     second thread so a callback that logs cannot deadlock the worker.
 ******************************************************************************/

#include "utils/Logger.hpp"
#include "format_tools.hpp"
#include "platform.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <deque>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <variant>
#include <vector>

#if ELWORKBENCH_IS_WINDOWS
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#if defined(ELWORKBENCH_PLATFORM_LINUX)
#include <sys/syscall.h>
#elif defined(ELWORKBENCH_PLATFORM_APPLE)
#include <pthread.h>
#endif
#endif

namespace elworkbench::utils
{

/**
 * @class CallbackDispatcher
 * @brief Runs user-provided callbacks on a dedicated thread.
 *
 * Decouples the write-error callback from the Logger worker so that the
 * callback may itself log.
 */
class CallbackDispatcher
{
  public:
    CallbackDispatcher() : shutdown_requested_(false)
    {
        worker_ = std::thread([this] { this->run(); });
    }

    ~CallbackDispatcher() { shutdown(); }

    void post(std::function<void()> fn)
    {
        if (shutdown_requested_.load(std::memory_order_relaxed))
            return;
        {
            std::lock_guard<std::mutex> lg(mutex_);
            queue_.push_back(std::move(fn));
        }
        cv_.notify_one();
    }

    void shutdown()
    {
        if (shutdown_requested_.exchange(true))
            return;
        cv_.notify_one();
        if (worker_.joinable())
            worker_.join();
    }

  private:
    void run()
    {
        for (;;)
        {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> ul(mutex_);
                cv_.wait(ul, [this] { return shutdown_requested_.load() || !queue_.empty(); });
                if (shutdown_requested_.load() && queue_.empty())
                    return;
                fn = std::move(queue_.front());
                queue_.pop_front();
            }
            try
            {
                fn();
            }
            catch (const std::exception &ex)
            {
                // The logger itself is the failing component here; stderr is the only outlet.
                std::fprintf(stderr, "[elworkbench::Logger] write-error callback threw: %s\n",
                             ex.what());
            }
        }
    }

    std::deque<std::function<void()>> queue_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    std::atomic<bool> shutdown_requested_;
};

// ============================================================================
// Commands and sinks
// ============================================================================

struct LogMessage
{
    Logger::Level level;
    std::chrono::system_clock::time_point timestamp;
    uint64_t thread_id;
    std::string body;
};

/**
 * @class Sink
 * @brief Abstract log destination. Only ever called from the worker thread.
 */
class Sink
{
  public:
    virtual ~Sink() = default;
    virtual void write(const LogMessage &msg) = 0;
    virtual void flush() = 0;
    virtual std::string description() const = 0;
};

static uint64_t get_native_thread_id() noexcept
{
#if ELWORKBENCH_IS_WINDOWS
    return static_cast<uint64_t>(::GetCurrentThreadId());
#elif defined(ELWORKBENCH_PLATFORM_APPLE)
    uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return tid;
#elif defined(ELWORKBENCH_PLATFORM_LINUX)
    return static_cast<uint64_t>(::syscall(SYS_gettid));
#else
    return std::hash<std::thread::id>()(std::this_thread::get_id());
#endif
}

static std::string format_message(const LogMessage &msg)
{
    std::string time_str = format_tools::formatted_time(msg.timestamp);
    return fmt::format("[{}] [{:<6}] [{:5}] {}\n", time_str, Logger::level_name(msg.level),
                       msg.thread_id, msg.body);
}

class ConsoleSink : public Sink
{
  public:
    void write(const LogMessage &msg) override { fmt::print(stderr, "{}", format_message(msg)); }
    void flush() override { std::fflush(stderr); }
    std::string description() const override { return "Console"; }
};

class FileSink : public Sink
{
  public:
    explicit FileSink(const std::string &path) : path_(path)
    {
#if ELWORKBENCH_IS_WINDOWS
        int needed = MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, nullptr, 0);
        if (needed == 0)
            throw std::runtime_error("Failed to convert path to wide string");
        std::wstring wpath(needed, L'\0');
        MultiByteToWideChar(CP_UTF8, 0, path.c_str(), -1, &wpath[0], needed);
        handle_ = CreateFileW(wpath.c_str(), FILE_APPEND_DATA, FILE_SHARE_READ | FILE_SHARE_WRITE,
                              nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle_ == INVALID_HANDLE_VALUE)
            throw std::runtime_error("Failed to open log file: " + path);
#else
        fd_ = ::open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
        if (fd_ == -1)
            throw std::runtime_error("Failed to open log file: " + path);
#endif
    }

    ~FileSink() override
    {
#if ELWORKBENCH_IS_WINDOWS
        if (handle_ != INVALID_HANDLE_VALUE)
            CloseHandle(handle_);
#else
        if (fd_ != -1)
            ::close(fd_);
#endif
    }

    void write(const LogMessage &msg) override
    {
        const auto line = format_message(msg);
#if ELWORKBENCH_IS_WINDOWS
        DWORD bytes_written = 0;
        if (!WriteFile(handle_, line.c_str(), static_cast<DWORD>(line.length()), &bytes_written,
                       nullptr))
            throw std::runtime_error("WriteFile failed for " + path_);
#else
        const char *buf = line.data();
        size_t remaining = line.size();
        while (remaining > 0)
        {
            ssize_t w = ::write(fd_, buf, remaining);
            if (w < 0)
                throw std::runtime_error("write failed for " + path_);
            buf += w;
            remaining -= static_cast<size_t>(w);
        }
#endif
    }

    void flush() override
    {
#if ELWORKBENCH_IS_WINDOWS
        FlushFileBuffers(handle_);
#else
        ::fsync(fd_);
#endif
    }

    std::string description() const override { return "File: " + path_; }

  private:
    std::string path_;
#if ELWORKBENCH_IS_WINDOWS
    HANDLE handle_ = INVALID_HANDLE_VALUE;
#else
    int fd_ = -1;
#endif
};

struct SetSinkCommand { std::unique_ptr<Sink> new_sink; };
struct SinkCreationErrorCommand { std::string error_message; };
struct FlushCommand { std::shared_ptr<std::promise<void>> promise; };
struct SetErrorCallbackCommand { std::function<void(const std::string &)> callback; };

using Command = std::variant<LogMessage, SetSinkCommand, SinkCreationErrorCommand, FlushCommand,
                             SetErrorCallbackCommand>;

// ============================================================================
// Pimpl
// ============================================================================

struct Impl
{
    Impl();
    ~Impl();

    void worker_loop();
    void enqueue_command(Command &&cmd);
    void report_error(std::string message);
    void shutdown();

    std::thread worker_thread_;
    std::vector<Command> queue_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::atomic<bool> shutdown_requested_{false};
    std::atomic<bool> shutdown_completed_{false};

    std::atomic<Logger::Level> level_{Logger::Level::L_INFO};

    // Worker-owned state.
    std::unique_ptr<Sink> sink_;
    std::function<void(const std::string &)> error_callback_;
    CallbackDispatcher callback_dispatcher_;
};

Impl::Impl() : sink_(std::make_unique<ConsoleSink>())
{
    worker_thread_ = std::thread(&Impl::worker_loop, this);
}

Impl::~Impl()
{
    if (!shutdown_requested_.load())
    {
        fmt::print(stderr, "[elworkbench::Logger WARNING]: Logger was not shut down explicitly. "
                           "Call Logger::instance().shutdown() before main() returns.\n");
#if ELWORKBENCH_IS_WINDOWS
        // Joining under the loader lock can deadlock during static destruction.
        worker_thread_.detach();
#else
        shutdown();
#endif
    }
}

void Impl::enqueue_command(Command &&cmd)
{
    if (!shutdown_requested_.load(std::memory_order_relaxed))
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!shutdown_requested_.load(std::memory_order_acquire))
        {
            queue_.emplace_back(std::move(cmd));
            cv_.notify_one();
            return;
        }
    }

    // After shutdown, keep log messages visible instead of dropping them.
    if (const auto *msg = std::get_if<LogMessage>(&cmd))
        fmt::print(stderr, "[elworkbench::Logger-fallback] {}", format_message(*msg));
    else if (auto *flush = std::get_if<FlushCommand>(&cmd))
        flush->promise->set_value();
}

void Impl::report_error(std::string message)
{
    if (error_callback_)
    {
        auto cb = error_callback_;
        callback_dispatcher_.post([cb, msg = std::move(message)]() { cb(msg); });
    }
    else
    {
        fmt::print(stderr, "[elworkbench::Logger] {}\n", message);
    }
}

void Impl::worker_loop()
{
    std::vector<Command> local_queue;

    while (true)
    {
        bool do_final_flush_and_break = false;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return !queue_.empty() || shutdown_requested_.load(); });
            if (shutdown_requested_.load() && queue_.empty())
                do_final_flush_and_break = true;
            local_queue.swap(queue_);
        }

        if (do_final_flush_and_break)
        {
            if (sink_)
                sink_->flush();
            break;
        }

        for (auto &cmd : local_queue)
        {
            try
            {
                std::visit(
                    [this](auto &&arg) {
                        using T = std::decay_t<decltype(arg)>;
                        if constexpr (std::is_same_v<T, LogMessage>)
                        {
                            if (sink_ && arg.level >= level_.load(std::memory_order_relaxed))
                                sink_->write(arg);
                        }
                        else if constexpr (std::is_same_v<T, SetSinkCommand>)
                        {
                            const std::string old_desc = sink_ ? sink_->description() : "null";
                            const std::string new_desc =
                                arg.new_sink ? arg.new_sink->description() : "null";
                            if (sink_)
                            {
                                sink_->write({Logger::Level::L_SYSTEM,
                                              std::chrono::system_clock::now(),
                                              get_native_thread_id(),
                                              "Switching log sink to: " + new_desc});
                                sink_->flush();
                            }
                            sink_ = std::move(arg.new_sink);
                            if (sink_)
                            {
                                sink_->write({Logger::Level::L_SYSTEM,
                                              std::chrono::system_clock::now(),
                                              get_native_thread_id(),
                                              "Log sink switched from: " + old_desc});
                            }
                        }
                        else if constexpr (std::is_same_v<T, SinkCreationErrorCommand>)
                        {
                            report_error(arg.error_message);
                        }
                        else if constexpr (std::is_same_v<T, FlushCommand>)
                        {
                            if (sink_)
                                sink_->flush();
                            arg.promise->set_value();
                        }
                        else if constexpr (std::is_same_v<T, SetErrorCallbackCommand>)
                        {
                            error_callback_ = std::move(arg.callback);
                        }
                    },
                    std::move(cmd));
            }
            catch (const std::exception &e)
            {
                report_error(fmt::format("Logger worker error: {}", e.what()));
            }
        }
        local_queue.clear();
    }
}

void Impl::shutdown()
{
    if (shutdown_completed_.load() || shutdown_requested_.exchange(true))
        return;

    cv_.notify_one();
    if (worker_thread_.joinable())
        worker_thread_.join();

    // No more callbacks can be generated past this point.
    callback_dispatcher_.shutdown();
    shutdown_completed_.store(true);
}

// ============================================================================
// Logger public API
// ============================================================================

namespace
{
std::unique_ptr<Logger> g_instance;
std::mutex g_instance_mutex;
} // namespace

Logger::Logger() : pImpl(std::make_unique<Impl>()) {}

Logger::~Logger() = default;

Logger &Logger::instance()
{
    std::lock_guard<std::mutex> lock(g_instance_mutex);
    if (!g_instance)
    {
        struct LoggerMaker : public Logger
        {
            LoggerMaker() : Logger() {}
        };
        g_instance = std::make_unique<LoggerMaker>();
    }
    return *g_instance;
}

void Logger::set_console()
{
    pImpl->enqueue_command(SetSinkCommand{std::make_unique<ConsoleSink>()});
}

void Logger::set_logfile(const std::string &utf8_path)
{
    try
    {
        pImpl->enqueue_command(SetSinkCommand{std::make_unique<FileSink>(utf8_path)});
    }
    catch (const std::exception &e)
    {
        pImpl->enqueue_command(
            SinkCreationErrorCommand{fmt::format("Failed to create FileSink: {}", e.what())});
    }
}

void Logger::shutdown()
{
    if (pImpl)
        pImpl->shutdown();
}

void Logger::flush()
{
    if (!pImpl || pImpl->shutdown_requested_.load())
        return;

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();
    pImpl->enqueue_command(FlushCommand{promise});
    future.wait();
}

void Logger::set_level(Level lvl)
{
    if (pImpl)
        pImpl->level_.store(lvl, std::memory_order_relaxed);
}

Logger::Level Logger::level() const
{
    return pImpl ? pImpl->level_.load(std::memory_order_relaxed) : Level::L_INFO;
}

void Logger::set_write_error_callback(std::function<void(const std::string &)> cb)
{
    if (pImpl)
        pImpl->enqueue_command(SetErrorCallbackCommand{std::move(cb)});
}

const char *Logger::level_name(Level lvl) noexcept
{
    switch (lvl)
    {
    case Level::L_TRACE: return "TRACE";
    case Level::L_DEBUG: return "DEBUG";
    case Level::L_INFO: return "INFO";
    case Level::L_WARNING: return "WARN";
    case Level::L_ERROR: return "ERROR";
    case Level::L_SYSTEM: return "SYSTEM";
    }
    return "UNK";
}

std::optional<Logger::Level> Logger::parse_level(std::string_view name) noexcept
{
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") return Level::L_TRACE;
    if (upper == "DEBUG") return Level::L_DEBUG;
    if (upper == "INFO") return Level::L_INFO;
    if (upper == "WARN" || upper == "WARNING") return Level::L_WARNING;
    if (upper == "ERROR") return Level::L_ERROR;
    if (upper == "SYSTEM") return Level::L_SYSTEM;
    return std::nullopt;
}

void Logger::log_message(Level lvl, std::string body) noexcept
{
    if (should_log(lvl))
        enqueue_log(lvl, std::move(body));
}

bool Logger::should_log(Level lvl) const noexcept
{
    return pImpl &&
           static_cast<int>(lvl) >= static_cast<int>(pImpl->level_.load(std::memory_order_relaxed));
}

void Logger::enqueue_log(Level lvl, std::string &&body) noexcept
{
    if (!pImpl)
        return;
    try
    {
        pImpl->enqueue_command(
            LogMessage{lvl, std::chrono::system_clock::now(), get_native_thread_id(), std::move(body)});
    }
    catch (const std::exception &ex)
    {
        std::fprintf(stderr, "[elworkbench::Logger] failed to enqueue message: %s\n", ex.what());
    }
}

} // namespace elworkbench::utils
