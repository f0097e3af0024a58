/**
 * @file workbench_main.cpp
 * @brief elworkbench entry point.
 *
 * Loads the configuration, opens the session log, wires the workbench and
 * runs one measurement pass against the configured instruments:
 * restore the last profile, connect, acquire a spectrum, report its peak,
 * run a short I-V sweep, disconnect.
 *
 * With `--watch` the spectrometer keeps acquiring after the pass until
 * SIGINT / SIGTERM.
 *
 * Usage: elworkbench [--watch] [config.json]
 * The config path defaults to $ELWORKBENCH_CONFIG_FILE, then config/workbench.json.
 */
#include "app/bootstrap.hpp"
#include "app/session_log.hpp"
#include "app/workbench_config.hpp"
#include "utils/Logger.hpp"
#include "utils/ScopeGuard.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <string>
#include <thread>

#include <fmt/format.h>

using namespace elworkbench;

static std::atomic<bool> g_shutdown_requested{false};

static void signal_handler(int /*sig*/) noexcept
{
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

namespace
{

int run_pass(app::Workbench &bench, bool watch)
{
    auto &profiles = bench.profiles();
    if (auto st = profiles.load_all(); st.is_error())
    {
        LOGGER_ERROR("main: {}", st.message());
        return 1;
    }
    if (auto st = profiles.restore_last_used(); st.is_error())
    {
        if (st.error() != broker::ErrorKind::NoSelection)
        {
            LOGGER_ERROR("main: {}", st.message());
            return 1;
        }
        auto created = profiles.create_profile("Default");
        if (created.is_error())
            return 1;
        if (auto sel = profiles.select_profile(created.content()); sel.is_error())
            return 1;
    }
    fmt::print("Profile: {} / device: {}\n", bench.profile_api().profile_name(),
               bench.profile_api().device_name());

    const auto &cfg = bench.config();
    auto idn = bench.smu().connect(cfg.smu.port);
    if (idn.is_error())
    {
        fmt::print(stderr, "{}\n", idn.message());
        return 2;
    }
    fmt::print("SMU: {}\n", idn.content());

    auto ident = bench.spectrometer().connect(cfg.spectrometer.port);
    if (ident.is_error())
    {
        fmt::print(stderr, "{}\n", ident.message());
        return 2;
    }
    fmt::print("Spectrometer: {} ({})\n", ident.content().model, ident.content().serial_number);

    if (auto st = bench.acquisition().acquire_once(); st.is_error())
    {
        fmt::print(stderr, "{}\n", st.message());
        return 3;
    }
    if (auto peak = bench.analysis().find_peak())
    {
        fmt::print("Peak at pixel {} ({:.1f} nm), intensity {:.0f}\n", peak->index,
                   peak->wavelength_nm.value_or(0.0), peak->intensity);
    }

    modules::SweepParameters sweep;
    sweep.start = 0.0;
    sweep.end = 1.0;
    sweep.step = 0.25;
    sweep.limit = 0.1;
    sweep.point_delay = std::chrono::milliseconds(10);
    if (auto st = bench.sweep().start(sweep); st.is_error())
    {
        fmt::print(stderr, "{}\n", st.message());
        return 3;
    }
    bench.sweep().wait();
    const auto xs = bench.broker().get_volatile(broker::VolatileSlot::SweepX);
    const auto ys = bench.broker().get_volatile(broker::VolatileSlot::SweepY);
    if (xs && ys)
    {
        for (std::size_t i = 0; i < xs->size() && i < ys->size(); ++i)
            fmt::print("  V = {:8.4f} V   I = {:10.6f} A\n", (*xs)[i], (*ys)[i]);
    }

    if (watch)
    {
        if (auto st = bench.acquisition().start_continuous(); st.is_ok())
        {
            fmt::print("Acquiring continuously, Ctrl-C to stop\n");
            while (!g_shutdown_requested.load(std::memory_order_relaxed) && bench.acquisition().is_running())
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            bench.acquisition().stop();
            fmt::print("{} spectra acquired\n", bench.acquisition().published_count());
        }
    }

    for (auto *device : {static_cast<api::DeviceCapabilityApi *>(&bench.spectrometer()),
                         static_cast<api::DeviceCapabilityApi *>(&bench.smu())})
    {
        if (auto st = device->disconnect(); st.is_error())
            LOGGER_WARN("main: {}", st.message());
    }
    const auto outcome = bench.sweep().last_outcome();
    return outcome == modules::SweepOutcome::Completed ? 0 : 3;
}

} // namespace

int main(int argc, char **argv)
{
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto &logger = utils::Logger::instance();
    logger.set_console();
    auto shutdown_logger = utils::make_scope_guard([&logger] { logger.shutdown(); });

    bool watch = false;
    std::filesystem::path config_path = app::config_path_from_env();
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--watch")
            watch = true;
        else if (arg == "-h" || arg == "--help")
        {
            fmt::print("Usage: {} [--watch] [config.json]\n", argv[0]);
            return 0;
        }
        else
            config_path = arg;
    }

    try
    {
        auto loaded = app::load_config(config_path);
        if (loaded.is_error())
        {
            fmt::print(stderr, "{}: {}\n", config_path.string(), loaded.message());
            return 1;
        }
        app::WorkbenchConfig config = std::move(loaded).content();
        app::apply_env_overrides(config);

        app::prune_old_logs(config.log_dir, config.log_retention_years);
        const auto log_file = app::setup_session_log(config.log_dir, config.log_level);
        fmt::print("Logging to {}\n", log_file.string());

        app::Workbench bench(config);
        bench.broker().status().add_listener([](const broker::StatusMessage &msg) {
            fmt::print("[{}] {}\n", broker::to_string(msg.severity), msg.text);
        });
        return run_pass(bench, watch);
    }
    catch (const std::exception &ex)
    {
        LOGGER_ERROR("main: fatal: {}", ex.what());
        fmt::print(stderr, "fatal: {}\n", ex.what());
        return 1;
    }
}
