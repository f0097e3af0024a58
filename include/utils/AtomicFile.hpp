#pragma once

/**
 * @file AtomicFile.hpp
 * @brief Durable JSON document I/O shared by JsonConfig and the profile store.
 *
 * Writes never leave a partially written target: the document is written to a
 * temp file in the target's directory, fsync'ed, renamed over the target under
 * an advisory lock, and the directory is fsync'ed. On any failure the temp file
 * is removed and the previous target content is untouched.
 */

#include <filesystem>
#include <optional>
#include <system_error>

#include <nlohmann/json.hpp>

#include "elworkbench_utils_export.h"

namespace elworkbench::utils
{

/**
 * @brief Atomically replace @p target with the pretty-printed @p j.
 * @param ec optional out-parameter receiving the failure reason.
 * @return true on success. Never throws.
 *
 * Parent directories are created when missing. A symbolic link at @p target is
 * refused (operation_not_permitted).
 */
ELWORKBENCH_UTILS_EXPORT bool atomic_write_json(const std::filesystem::path &target,
                                                const nlohmann::json &j,
                                                std::error_code *ec = nullptr) noexcept;

/**
 * @brief Parse the JSON document stored at @p path.
 * @return the document, or nullopt when the file is missing or unparsable
 *         (@p ec tells which: no_such_file_or_directory or invalid_argument).
 */
ELWORKBENCH_UTILS_EXPORT std::optional<nlohmann::json>
read_json_file(const std::filesystem::path &path, std::error_code *ec = nullptr) noexcept;

} // namespace elworkbench::utils
