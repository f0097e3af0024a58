#pragma once
/**
 * @file profile_store.hpp
 * @brief Owning module of user profiles and the devices inside them.
 *
 * Layout on disk:
 *
 *   <profiles_dir>/<id>.json          one profile per file
 *   <profiles_dir>/last_profile.json  JSON string: id of the last selected profile
 *
 * A profile record:
 *
 *   {
 *     "id": "<uuid v4>", "name": "...",
 *     "storage_location": "", "last_sample_id": "",
 *     "devices": [ { "id": "<uuid v4>", "name": "...", "shape_type": "rectangle",
 *                    "width": 0.001, "length": 0.002, "radius": 0.0,
 *                    "custom_area_enabled": false, "Area": 2e-6 } ],
 *     "last_selected_device_id": "<uuid v4>" | null
 *   }
 *
 * Dimensions are in metres, `Area` in square metres. Files written by older
 * versions (`uuid` / `device_name` device keys, `last_selected_device_uuid`)
 * are migrated on load.
 *
 * All writes go through utils::atomic_write_json; a failed write leaves both
 * the file and the in-memory cache unchanged and is reported as IoError.
 * Every state change is reported on the status channel.
 */

#include "broker/persistable_owner.hpp"
#include "broker/status_channel.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace elworkbench::modules
{

enum class DeviceShape
{
    Rectangle,
    Circle,
};

struct DeviceGeometry
{
    DeviceShape shape{DeviceShape::Rectangle};
    double width_m{0.0};
    double length_m{0.0};
    double radius_m{0.0};
    bool custom_area_enabled{false};
    double custom_area_m2{0.0};
};

/// Area in m²: width × length, π r², or the custom area when enabled.
double device_area_m2(const DeviceGeometry &geometry) noexcept;

/// Geometry fields of a device record; missing or mistyped fields read as 0 / rectangle.
DeviceGeometry geometry_from_record(const nlohmann::json &device);

class ProfileStore final : public broker::ProfileOwner
{
  public:
    static constexpr const char *kLastProfileFile = "last_profile.json";

    ProfileStore(std::filesystem::path profiles_dir, broker::StatusChannel &status);

    ProfileStore(const ProfileStore &) = delete;
    ProfileStore &operator=(const ProfileStore &) = delete;

    [[nodiscard]] const std::filesystem::path &profiles_dir() const noexcept { return m_dir; }

    /**
     * @brief (Re)scan the profiles directory, creating it when missing.
     *
     * Malformed files are skipped and reported as errors. The selection is
     * cleared.
     * @return IoError if the directory cannot be created or listed.
     */
    broker::ApiStatus load_all();

    /// Selects the profile from last_profile.json, else the first by name.
    broker::ApiStatus restore_last_used();

    broker::ApiResult<std::string> create_profile(const std::string &name);
    broker::ApiStatus select_profile(const std::string &id);
    void clear_selection();
    broker::ApiStatus rename_profile(const std::string &id, const std::string &new_name);
    broker::ApiStatus delete_profile(const std::string &id);

    [[nodiscard]] std::optional<std::string> active_profile_id() const;
    [[nodiscard]] std::optional<std::string> active_device_id() const;

    // --- devices of the active profile ---
    broker::ApiResult<std::string> add_device(const std::string &name, const DeviceGeometry &geometry);
    /// Replaces the device with the same id; `Area` is recomputed from the geometry.
    broker::ApiStatus update_device(const nlohmann::json &device);
    broker::ApiStatus remove_device(const std::string &id);
    broker::ApiStatus select_device(const std::string &id);
    [[nodiscard]] std::vector<nlohmann::json> devices() const;

    // --- ProfileOwner ---
    [[nodiscard]] std::optional<nlohmann::json> active_record() const override;
    [[nodiscard]] broker::ApiResult<nlohmann::json> load_record(const std::string &id) const override;
    [[nodiscard]] std::vector<broker::RecordSummary> list_records() const override;
    broker::ApiStatus save_record(const nlohmann::json &record) override;
    broker::ApiStatus rename_record(const std::string &id, const std::string &new_name) override;
    [[nodiscard]] std::optional<nlohmann::json> active_device() const override;

  private:
    std::filesystem::path path_for(const std::string &id) const;
    broker::ApiStatus persist_locked(const nlohmann::json &record);
    void remember_last_used_locked(const std::optional<std::string> &id);
    bool name_taken_locked(const std::string &name, const std::string &except_id) const;
    void select_initial_device_locked();
    broker::ApiStatus set_last_device_locked(const std::optional<std::string> &device_id);
    nlohmann::json *active_locked();
    const nlohmann::json *active_locked() const;

    /// Report on the status channel and return the failure.
    template <typename T = void>
    broker::ApiResult<T> fail(broker::ErrorKind kind, const std::string &detail) const
    {
        report_failure(kind, detail);
        return broker::failure<T>(kind, detail);
    }
    void report_failure(broker::ErrorKind kind, const std::string &detail) const;

    const std::filesystem::path m_dir;
    broker::StatusChannel &m_status;

    // Recursive: status listeners run on the calling thread and may read back.
    mutable std::recursive_mutex m_mutex;
    std::map<std::string, nlohmann::json> m_profiles;
    std::optional<std::string> m_active_profile;
    std::optional<std::string> m_active_device;
};

} // namespace elworkbench::modules
