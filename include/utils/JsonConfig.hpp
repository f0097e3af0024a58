#pragma once

/**
 * @file JsonConfig.hpp
 * @brief Thread-safe configuration holder with atomic on-disk writes.
 *
 * Design:
 *  - JsonConfig owns an in-memory `nlohmann::json` document bound to one file.
 *  - Consumers manipulate the JSON inside short callbacks passed to `with_json_write` /
 *    `with_json_read`. The callbacks run under the instance's locks.
 *  - Every successful write callback is persisted through `atomic_write_json`.
 *
 * Error handling:
 *  - Public methods do not throw; they return bool and optionally report the
 *    reason through an `std::error_code*` out-parameter (default nullptr).
 *
 * Threading & locking:
 *  - `initMutex` serializes structural operations (init/reload/save) and
 *    protects the bound path.
 *  - `rwMutex` permits concurrent shared reads and exclusive writes to the
 *    in-memory document.
 *  - A callback that re-enters the same instance is refused with
 *    `resource_deadlock_would_occur`.
 *
 * Usage:
 *  JsonConfig cfg("config/workbench.json", true);
 *  cfg.with_json_write([](nlohmann::json &j){ j["log_level"] = "DEBUG"; });
 *  cfg.with_json_read([](nlohmann::json const &j){
 *      auto dir = j.value("profiles_dir", std::string("data/profiles"));
 *  });
 */

#include <filesystem>
#include <functional>
#include <memory>
#include <system_error>

#include <nlohmann/json.hpp>

#include "elworkbench_utils_export.h"

namespace elworkbench::utils
{

class ELWORKBENCH_UTILS_EXPORT JsonConfig
{
  public:
    /** @brief Uninitialized instance; call init() to bind a file. */
    JsonConfig() noexcept;

    /**
     * @brief Construct and initialize with a config path.
     * @param configFile path to the config file
     * @param createIfMissing if true, create a file holding `{}` when missing
     * @param ec optional diagnostic out-parameter
     */
    explicit JsonConfig(const std::filesystem::path &configFile, bool createIfMissing = false,
                        std::error_code *ec = nullptr);

    ~JsonConfig();

    JsonConfig(const JsonConfig &) = delete;
    JsonConfig &operator=(const JsonConfig &) = delete;
    JsonConfig(JsonConfig &&) noexcept;
    JsonConfig &operator=(JsonConfig &&) noexcept;

    /**
     * @brief Bind (or rebind) to a file and load it.
     * @return true on success, false on failure (see ec if provided)
     */
    bool init(const std::filesystem::path &configFile, bool createIfMissing = false,
              std::error_code *ec = nullptr);

    /**
     * @brief Replace the in-memory document with the file content.
     *
     * A missing file loads as `{}`. An unparsable file fails with
     * `invalid_argument` and leaves the in-memory document unchanged.
     */
    bool reload(std::error_code *ec = nullptr) noexcept;

    /** @brief Persist the in-memory document atomically. */
    bool save(std::error_code *ec = nullptr) noexcept;

    /**
     * @brief Exclusive access to the document, followed by save().
     *
     * If the callback throws, the exception is logged, nothing is saved and
     * false is returned.
     */
    bool with_json_write_impl(std::function<void(nlohmann::json &)> fn,
                              std::error_code *ec = nullptr) noexcept;

    /** @brief Shared read-only access to the document. */
    bool with_json_read_impl(std::function<void(nlohmann::json const &)> fn,
                             std::error_code *ec = nullptr) const noexcept;

    template <typename F>
    bool with_json_write(F &&fn, std::error_code *ec = nullptr) noexcept
    {
        try
        {
            std::function<void(nlohmann::json &)> cb = std::forward<F>(fn);
            return with_json_write_impl(std::move(cb), ec);
        }
        catch (const std::exception &)
        {
            if (ec) *ec = std::make_error_code(std::errc::not_enough_memory);
            return false;
        }
    }

    template <typename F>
    bool with_json_read(F &&fn, std::error_code *ec = nullptr) const noexcept
    {
        try
        {
            std::function<void(nlohmann::json const &)> cb = std::forward<F>(fn);
            return with_json_read_impl(std::move(cb), ec);
        }
        catch (const std::exception &)
        {
            if (ec) *ec = std::make_error_code(std::errc::not_enough_memory);
            return false;
        }
    }

    bool is_initialized() const noexcept;
    std::filesystem::path config_path() const noexcept;

  private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace elworkbench::utils
