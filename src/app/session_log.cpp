#include "app/session_log.hpp"
#include "format_tools.hpp"

#include <system_error>

namespace elworkbench::app
{

namespace fs = std::filesystem;

fs::path setup_session_log(const fs::path &log_dir, utils::Logger::Level level,
                           std::chrono::system_clock::time_point now)
{
    fs::create_directories(log_dir);
    const fs::path file = log_dir / (format_tools::filename_timestamp(now) + ".log");

    auto &logger = utils::Logger::instance();
    logger.set_logfile(file.string());
    logger.set_level(level);
    LOGGER_INFO("Session log '{}' (level {})", file.string(), utils::Logger::level_name(level));
    return file;
}

std::size_t prune_old_logs(const fs::path &log_dir, unsigned retention_years,
                           std::chrono::system_clock::time_point now)
{
    std::error_code ec;
    if (!fs::is_directory(log_dir, ec))
        return 0;

    const auto cutoff = now - std::chrono::hours(24) * 365 * retention_years;
    std::size_t removed = 0;
    for (fs::directory_iterator it(log_dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::path &path = it->path();
        if (path.extension() != ".log" || !it->is_regular_file(ec))
            continue;
        const auto stamp = format_tools::parse_filename_timestamp(path.stem().string());
        if (!stamp || *stamp >= cutoff)
            continue;

        std::error_code rm_ec;
        if (fs::remove(path, rm_ec))
            ++removed;
        else if (rm_ec)
            LOGGER_WARN("Session log: cannot remove '{}': {}", path.string(), rm_ec.message());
    }
    if (ec)
        LOGGER_WARN("Session log: scanning '{}' failed: {}", log_dir.string(), ec.message());
    if (removed > 0)
        LOGGER_INFO("Session log: removed {} log file(s) older than {} year(s)", removed, retention_years);
    return removed;
}

} // namespace elworkbench::app
