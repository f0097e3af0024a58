#pragma once
/**
 * @file session_log.hpp
 * @brief One log file per application run, named after its start time.
 *
 * Files live in the configured log directory as `YYYY-MM-DD_HH-MM-SS.log`.
 * Files older than the retention period are removed at startup; files whose
 * name is not a timestamp are left alone.
 */

#include "utils/Logger.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace elworkbench::app
{

/**
 * @brief Create @p log_dir if needed and point the Logger at a new file in it.
 * @return path of the session log.
 * @throws std::filesystem::filesystem_error if the directory cannot be created.
 */
std::filesystem::path setup_session_log(const std::filesystem::path &log_dir, utils::Logger::Level level,
                                        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

/// Removes `*.log` files named before @p now minus @p retention_years years. Returns the count removed.
std::size_t prune_old_logs(const std::filesystem::path &log_dir, unsigned retention_years,
                           std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

} // namespace elworkbench::app
