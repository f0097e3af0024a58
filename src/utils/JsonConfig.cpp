/**
 * @file JsonConfig.cpp
 * @brief Implementation of JsonConfig on top of atomic_write_json / read_json_file.
 *
 *  - `with_json_write_impl` takes `initMutex`, then the exclusive `rwMutex` for the
 *    callback, releases it and persists the snapshot through save().
 *  - `save` snapshots under the shared lock and calls atomic_write_json.
 *
 * Public methods never throw; failures are logged and reported through the
 * optional std::error_code.
 */
#include "utils/JsonConfig.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/Logger.hpp"
#include "utils/RecursionGuard.hpp"

#include <atomic>
#include <mutex>
#include <shared_mutex>

namespace elworkbench::utils
{

namespace fs = std::filesystem;

struct JsonConfig::Impl
{
    fs::path configPath;
    nlohmann::json data = nlohmann::json::object();

    // Structural lock: bound path and init/reload/save.
    mutable std::mutex initMutex;

    // Data lock: shared reads / exclusive writes.
    mutable std::shared_mutex rwMutex;

    std::atomic<bool> dirty{false};

    // Both callers hold initMutex.
    bool reload_locked(std::error_code *ec) noexcept;
    bool save_locked(std::error_code *ec) noexcept;
};

bool JsonConfig::Impl::reload_locked(std::error_code *ec) noexcept
{
    std::error_code read_ec;
    auto loaded = read_json_file(configPath, &read_ec);
    if (!loaded)
    {
        if (read_ec == std::errc::no_such_file_or_directory)
        {
            std::unique_lock<std::shared_mutex> w(rwMutex);
            data = nlohmann::json::object();
            dirty.store(false, std::memory_order_release);
            if (ec) *ec = std::error_code{};
            return true;
        }
        if (ec) *ec = read_ec;
        LOGGER_ERROR("JsonConfig::reload: cannot load {}: {}", configPath.string(),
                     read_ec.message());
        return false;
    }

    std::unique_lock<std::shared_mutex> w(rwMutex);
    data = std::move(*loaded);
    dirty.store(false, std::memory_order_release);
    if (ec) *ec = std::error_code{};
    return true;
}

bool JsonConfig::Impl::save_locked(std::error_code *ec) noexcept
{
    nlohmann::json snapshot;
    try
    {
        std::shared_lock<std::shared_mutex> r(rwMutex);
        snapshot = data;
    }
    catch (const std::exception &ex)
    {
        if (ec) *ec = std::make_error_code(std::errc::not_enough_memory);
        LOGGER_ERROR("JsonConfig::save: snapshot failed: {}", ex.what());
        return false;
    }

    if (!atomic_write_json(configPath, snapshot, ec))
        return false;

    dirty.store(false, std::memory_order_release);
    return true;
}

// ---------------- Constructors / destructor ----------------

JsonConfig::JsonConfig() noexcept : pImpl(std::make_unique<Impl>()) {}

JsonConfig::JsonConfig(const fs::path &configFile, bool createIfMissing, std::error_code *ec)
    : pImpl(std::make_unique<Impl>())
{
    // Failures are logged and reported through ec; is_initialized() stays usable.
    (void)init(configFile, createIfMissing, ec);
}

JsonConfig::~JsonConfig() = default;
JsonConfig::JsonConfig(JsonConfig &&) noexcept = default;
JsonConfig &JsonConfig::operator=(JsonConfig &&) noexcept = default;

// ---------------- Simple accessors ----------------

bool JsonConfig::is_initialized() const noexcept
{
    if (!pImpl) return false;
    std::lock_guard<std::mutex> g(pImpl->initMutex);
    return !pImpl->configPath.empty();
}

fs::path JsonConfig::config_path() const noexcept
{
    if (!pImpl) return {};
    std::lock_guard<std::mutex> g(pImpl->initMutex);
    return pImpl->configPath;
}

// ---------------- init / reload / save ----------------

bool JsonConfig::init(const fs::path &configFile, bool createIfMissing, std::error_code *ec)
{
    if (!pImpl) pImpl = std::make_unique<Impl>();
    std::lock_guard<std::mutex> g(pImpl->initMutex);
    pImpl->configPath = configFile;

    if (createIfMissing)
    {
        std::error_code exists_ec;
        if (!fs::exists(configFile, exists_ec))
        {
            if (!atomic_write_json(configFile, nlohmann::json::object(), ec))
            {
                LOGGER_ERROR("JsonConfig::init: cannot create {}", configFile.string());
                return false;
            }
        }
    }

    return pImpl->reload_locked(ec);
}

bool JsonConfig::reload(std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        if (ec) *ec = std::make_error_code(std::errc::not_connected);
        return false;
    }
    std::lock_guard<std::mutex> g(pImpl->initMutex);
    if (pImpl->configPath.empty())
    {
        if (ec) *ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }
    return pImpl->reload_locked(ec);
}

bool JsonConfig::save(std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        if (ec) *ec = std::make_error_code(std::errc::not_connected);
        return false;
    }
    std::lock_guard<std::mutex> g(pImpl->initMutex);
    if (pImpl->configPath.empty())
    {
        if (ec) *ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return false;
    }
    return pImpl->save_locked(ec);
}

// ---------------- scoped accessors ----------------

bool JsonConfig::with_json_write_impl(std::function<void(nlohmann::json &)> fn,
                                      std::error_code *ec) noexcept
{
    if (!pImpl)
    {
        if (ec) *ec = std::make_error_code(std::errc::not_connected);
        return false;
    }

    const void *key = static_cast<const void *>(this);
    if (RecursionGuard::is_recursing(key))
    {
        if (ec) *ec = std::make_error_code(std::errc::resource_deadlock_would_occur);
        LOGGER_WARN("JsonConfig::with_json_write - recursive call detected; refusing to re-enter.");
        return false;
    }

    try
    {
        RecursionGuard guard(key);
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        if (pImpl->configPath.empty())
        {
            if (ec) *ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return false;
        }

        {
            std::unique_lock<std::shared_mutex> w(pImpl->rwMutex);
            // Work on a copy so a throwing callback leaves the document untouched.
            nlohmann::json working = pImpl->data;
            fn(working);
            pImpl->data = std::move(working);
            pImpl->dirty.store(true, std::memory_order_release);
        }

        return pImpl->save_locked(ec);
    }
    catch (const std::exception &ex)
    {
        if (ec) *ec = std::make_error_code(std::errc::io_error);
        LOGGER_ERROR("JsonConfig::with_json_write: callback threw: {}", ex.what());
        return false;
    }
}

bool JsonConfig::with_json_read_impl(std::function<void(nlohmann::json const &)> fn,
                                     std::error_code *ec) const noexcept
{
    if (!pImpl)
    {
        if (ec) *ec = std::make_error_code(std::errc::not_connected);
        return false;
    }

    const void *key = static_cast<const void *>(this);
    if (RecursionGuard::is_recursing(key))
    {
        if (ec) *ec = std::make_error_code(std::errc::resource_deadlock_would_occur);
        LOGGER_WARN("JsonConfig::with_json_read - recursive call detected; refusing to re-enter.");
        return false;
    }

    try
    {
        RecursionGuard guard(key);
        std::lock_guard<std::mutex> g(pImpl->initMutex);
        if (pImpl->configPath.empty())
        {
            if (ec) *ec = std::make_error_code(std::errc::no_such_file_or_directory);
            return false;
        }

        std::shared_lock<std::shared_mutex> r(pImpl->rwMutex);
        fn(pImpl->data);
        if (ec) *ec = std::error_code{};
        return true;
    }
    catch (const std::exception &ex)
    {
        if (ec) *ec = std::make_error_code(std::errc::io_error);
        LOGGER_ERROR("JsonConfig::with_json_read: callback threw: {}", ex.what());
        return false;
    }
}

} // namespace elworkbench::utils
