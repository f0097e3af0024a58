#include "modules/profile_store.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/Logger.hpp"
#include "utils/uid_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>

#include <fmt/format.h>

namespace elworkbench::modules
{

namespace fs = std::filesystem;
using broker::ApiResult;
using broker::ApiStatus;
using broker::ErrorKind;
using nlohmann::json;

namespace
{

std::string trimmed(const std::string &s)
{
    const auto first = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string{};
}

bool iequals(const std::string &a, const std::string &b)
{
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

double number_or_zero(const json &j, const char *key)
{
    const auto it = j.find(key);
    return (it != j.end() && it->is_number()) ? it->get<double>() : 0.0;
}

const char *shape_name(DeviceShape shape)
{
    return shape == DeviceShape::Circle ? "circle" : "rectangle";
}

bool valid_dimension(double v)
{
    return std::isfinite(v) && v >= 0.0;
}

std::string check_geometry(const DeviceGeometry &g)
{
    if (!valid_dimension(g.width_m) || !valid_dimension(g.length_m) || !valid_dimension(g.radius_m))
        return "device dimensions must be finite and non-negative";
    if (g.custom_area_enabled && !valid_dimension(g.custom_area_m2))
        return "custom area must be finite and non-negative";
    return {};
}

void write_geometry(json &device, const DeviceGeometry &g)
{
    device["shape_type"] = shape_name(g.shape);
    device["width"] = g.width_m;
    device["length"] = g.length_m;
    device["radius"] = g.radius_m;
    device["custom_area_enabled"] = g.custom_area_enabled;
    device["Area"] = device_area_m2(g);
}

// Key names used by files from before the id/name normalization.
void rename_key(json &j, const char *from, const char *to)
{
    if (j.is_object() && j.contains(from))
    {
        if (!j.contains(to))
            j[to] = j[from];
        j.erase(from);
    }
}

void migrate_legacy_keys(json &profile)
{
    rename_key(profile, "last_selected_device_uuid", "last_selected_device_id");
    const auto devices = profile.find("devices");
    if (devices != profile.end() && devices->is_array())
    {
        for (auto &device : *devices)
        {
            rename_key(device, "uuid", "id");
            rename_key(device, "device_name", "name");
        }
    }
}

json *find_device(json &profile, const std::string &id)
{
    for (auto &device : profile["devices"])
    {
        if (device.value("id", std::string{}) == id)
            return &device;
    }
    return nullptr;
}

bool device_name_taken(const json &profile, const std::string &name, const std::string &except_id)
{
    for (const auto &device : profile.at("devices"))
    {
        if (device.value("id", std::string{}) != except_id && iequals(device.value("name", std::string{}), name))
            return true;
    }
    return false;
}

} // namespace

double device_area_m2(const DeviceGeometry &geometry) noexcept
{
    if (geometry.custom_area_enabled)
        return geometry.custom_area_m2;
    if (geometry.shape == DeviceShape::Circle)
        return std::numbers::pi * geometry.radius_m * geometry.radius_m;
    return geometry.width_m * geometry.length_m;
}

DeviceGeometry geometry_from_record(const json &device)
{
    DeviceGeometry g;
    if (!device.is_object())
        return g;
    const auto shape = device.find("shape_type");
    if (shape != device.end() && shape->is_string() && shape->get<std::string>() == "circle")
        g.shape = DeviceShape::Circle;
    g.width_m = number_or_zero(device, "width");
    g.length_m = number_or_zero(device, "length");
    g.radius_m = number_or_zero(device, "radius");
    const auto custom = device.find("custom_area_enabled");
    g.custom_area_enabled = custom != device.end() && custom->is_boolean() && custom->get<bool>();
    g.custom_area_m2 = number_or_zero(device, "Area");
    return g;
}

ProfileStore::ProfileStore(fs::path profiles_dir, broker::StatusChannel &status)
    : m_dir(std::move(profiles_dir)), m_status(status)
{
}

void ProfileStore::report_failure(ErrorKind kind, const std::string &detail) const
{
    const auto severity = (kind == ErrorKind::Io || kind == ErrorKind::MalformedRecord)
                              ? broker::Severity::Error
                              : broker::Severity::Warning;
    m_status.report(severity, fmt::format("[profiles] {}: {}", to_string(kind), detail));
}

fs::path ProfileStore::path_for(const std::string &id) const
{
    return m_dir / (id + ".json");
}

json *ProfileStore::active_locked()
{
    if (!m_active_profile)
        return nullptr;
    const auto it = m_profiles.find(*m_active_profile);
    return it == m_profiles.end() ? nullptr : &it->second;
}

const json *ProfileStore::active_locked() const
{
    if (!m_active_profile)
        return nullptr;
    const auto it = m_profiles.find(*m_active_profile);
    return it == m_profiles.end() ? nullptr : &it->second;
}

bool ProfileStore::name_taken_locked(const std::string &name, const std::string &except_id) const
{
    return std::any_of(m_profiles.begin(), m_profiles.end(), [&](const auto &entry) {
        return entry.first != except_id && iequals(entry.second.value("name", std::string{}), name);
    });
}

ApiStatus ProfileStore::persist_locked(const json &record)
{
    const std::string id = record.at("id").get<std::string>();
    std::error_code ec;
    if (!utils::atomic_write_json(path_for(id), record, &ec))
    {
        return fail(ErrorKind::Io, fmt::format("cannot write profile '{}' to '{}': {}",
                                               record.value("name", id), path_for(id).string(),
                                               ec.message()));
    }
    m_profiles[id] = record;
    return ApiStatus::ok();
}

void ProfileStore::remember_last_used_locked(const std::optional<std::string> &id)
{
    const fs::path path = m_dir / kLastProfileFile;
    std::error_code ec;
    if (id)
    {
        if (!utils::atomic_write_json(path, json(*id), &ec))
            report_failure(ErrorKind::Io, fmt::format("cannot record last used profile: {}", ec.message()));
        return;
    }
    if (fs::remove(path, ec))
        m_status.info("Removed stale last_profile.json");
    else if (ec)
        report_failure(ErrorKind::Io, fmt::format("cannot remove '{}': {}", path.string(), ec.message()));
}

ApiStatus ProfileStore::set_last_device_locked(const std::optional<std::string> &device_id)
{
    const json *profile = active_locked();
    if (profile == nullptr)
        return fail(ErrorKind::NoSelection, "no profile selected");

    const json wanted = device_id ? json(*device_id) : json(nullptr);
    if (profile->value("last_selected_device_id", json(nullptr)) == wanted)
        return ApiStatus::ok();

    json updated = *profile;
    updated["last_selected_device_id"] = wanted;
    return persist_locked(updated);
}

void ProfileStore::select_initial_device_locked()
{
    m_active_device.reset();
    json *profile = active_locked();
    if (profile == nullptr)
        return;

    auto &devices = (*profile)["devices"];
    const json last = profile->value("last_selected_device_id", json(nullptr));
    if (last.is_string())
    {
        if (find_device(*profile, last.get<std::string>()) != nullptr)
        {
            m_active_device = last.get<std::string>();
            return;
        }
        m_status.warning("Last used device not found in profile");
    }

    std::optional<std::string> chosen;
    if (!devices.empty())
        chosen = devices.front().value("id", std::string{});
    m_active_device = chosen;
    if (auto st = set_last_device_locked(chosen); st.is_error())
        LOGGER_WARN("ProfileStore: device selection not persisted: {}", st.message());
}

// ---------------------------------------------------------------------------
// Directory scan and selection
// ---------------------------------------------------------------------------

ApiStatus ProfileStore::load_all()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_profiles.clear();
    m_active_profile.reset();
    m_active_device.reset();

    std::error_code ec;
    if (!fs::is_directory(m_dir, ec))
    {
        if (!fs::create_directories(m_dir, ec) && ec)
            return fail(ErrorKind::Io, fmt::format("cannot create profiles directory '{}': {}",
                                                   m_dir.string(), ec.message()));
        m_status.info(fmt::format("Created profiles directory '{}'", m_dir.string()));
    }

    fs::directory_iterator it(m_dir, ec);
    if (ec)
        return fail(ErrorKind::Io,
                    fmt::format("cannot list profiles directory '{}': {}", m_dir.string(), ec.message()));

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            return fail(ErrorKind::Io, fmt::format("error while listing '{}': {}", m_dir.string(), ec.message()));

        const fs::path path = it->path();
        if (path.extension() != ".json" || path.filename() == kLastProfileFile)
            continue;

        std::error_code read_ec;
        auto doc = utils::read_json_file(path, &read_ec);
        if (!doc)
        {
            report_failure(ErrorKind::MalformedRecord, fmt::format("cannot load profile '{}': {}",
                                                                   path.filename().string(), read_ec.message()));
            continue;
        }

        migrate_legacy_keys(*doc);
        if (auto st = broker::validate_record_identity(*doc); st.is_error())
        {
            m_status.error(fmt::format("[profiles] skipping '{}': {}", path.filename().string(), st.message()));
            continue;
        }
        const std::string id = (*doc)["id"].get<std::string>();
        if (path.stem().string() != id)
        {
            report_failure(ErrorKind::MalformedRecord,
                           fmt::format("skipping '{}': file name does not match id {}", path.filename().string(), id));
            continue;
        }

        if (!doc->contains("devices") || !(*doc)["devices"].is_array())
            (*doc)["devices"] = json::array();
        if (!doc->contains("last_selected_device_id"))
            (*doc)["last_selected_device_id"] = nullptr;

        json kept = json::array();
        for (auto &device : (*doc)["devices"])
        {
            if (auto st = broker::validate_record_identity(device); st.is_error())
            {
                m_status.error(fmt::format("[profiles] profile '{}': dropping device: {}",
                                           (*doc)["name"].get<std::string>(), st.message()));
                continue;
            }
            write_geometry(device, geometry_from_record(device));
            kept.push_back(std::move(device));
        }
        (*doc)["devices"] = std::move(kept);
        m_profiles[id] = std::move(*doc);
    }

    m_status.info(fmt::format("{} profiles loaded", m_profiles.size()));
    return ApiStatus::ok();
}

ApiStatus ProfileStore::restore_last_used()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const fs::path path = m_dir / kLastProfileFile;

    std::optional<std::string> wanted;
    std::error_code ec;
    if (auto doc = utils::read_json_file(path, &ec))
    {
        if (doc->is_string())
            wanted = doc->get<std::string>();
        else
            m_status.warning("Ignoring last_profile.json: not a JSON string");
    }
    else if (ec != std::errc::no_such_file_or_directory)
    {
        m_status.warning(fmt::format("Cannot read last_profile.json: {}", ec.message()));
    }

    if (wanted && m_profiles.count(*wanted) == 0)
    {
        // Older versions stored the profile name.
        const auto by_name = std::find_if(m_profiles.begin(), m_profiles.end(), [&](const auto &entry) {
            return entry.second.value("name", std::string{}) == *wanted;
        });
        wanted = by_name == m_profiles.end() ? std::nullopt : std::optional<std::string>(by_name->first);
    }

    if (wanted)
        return select_profile(*wanted);

    if (!m_profiles.empty())
    {
        m_status.info("Last used profile not found, selecting the first profile");
        return select_profile(list_records().front().id);
    }

    clear_selection();
    remember_last_used_locked(std::nullopt);
    return fail(ErrorKind::NoSelection, "no profiles available");
}

ApiResult<std::string> ProfileStore::create_profile(const std::string &name)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const std::string clean = trimmed(name);
    if (clean.empty())
        return fail<std::string>(ErrorKind::Validation, "profile name must not be empty");
    if (name_taken_locked(clean, {}))
        return fail<std::string>(ErrorKind::Validation, fmt::format("a profile named '{}' already exists", clean));

    const std::string id = uid::generate_uuid_v4();
    const json record = {
        {"id", id},
        {"name", clean},
        {"storage_location", ""},
        {"last_sample_id", ""},
        {"devices", json::array()},
        {"last_selected_device_id", nullptr},
    };
    if (auto st = persist_locked(record); st.is_error())
        return ApiResult<std::string>::error(st.error(), st.message());

    m_status.info(fmt::format("Profile '{}' created", clean));
    if (auto st = select_profile(id); st.is_error())
        return ApiResult<std::string>::error(st.error(), st.message());
    return ApiResult<std::string>::ok(id);
}

ApiStatus ProfileStore::select_profile(const std::string &id)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const auto it = m_profiles.find(id);
    if (it == m_profiles.end())
        return fail(ErrorKind::Validation, fmt::format("unknown profile id {}", id));

    m_active_profile = id;
    remember_last_used_locked(id);
    select_initial_device_locked();
    m_status.info(fmt::format("Profile '{}' selected", it->second.value("name", id)));
    return ApiStatus::ok();
}

void ProfileStore::clear_selection()
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    m_active_profile.reset();
    m_active_device.reset();
}

ApiStatus ProfileStore::rename_profile(const std::string &id, const std::string &new_name)
{
    return rename_record(id, new_name);
}

ApiStatus ProfileStore::rename_record(const std::string &id, const std::string &new_name)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const auto it = m_profiles.find(id);
    if (it == m_profiles.end())
        return fail(ErrorKind::Validation, fmt::format("unknown profile id {}", id));

    const std::string clean = trimmed(new_name);
    if (clean.empty())
        return fail(ErrorKind::Validation, "profile name must not be empty");

    const std::string old_name = it->second.value("name", std::string{});
    if (clean == old_name)
        return ApiStatus::ok();
    if (name_taken_locked(clean, id))
        return fail(ErrorKind::Validation, fmt::format("a profile named '{}' already exists", clean));

    json updated = it->second;
    updated["name"] = clean;
    if (auto st = persist_locked(updated); st.is_error())
        return st;
    m_status.info(fmt::format("Profile '{}' renamed to '{}'", old_name, clean));
    return ApiStatus::ok();
}

ApiStatus ProfileStore::delete_profile(const std::string &id)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const auto it = m_profiles.find(id);
    if (it == m_profiles.end())
        return fail(ErrorKind::Validation, fmt::format("unknown profile id {}", id));

    std::error_code ec;
    fs::remove(path_for(id), ec);
    if (ec)
        return fail(ErrorKind::Io, fmt::format("cannot delete '{}': {}", path_for(id).string(), ec.message()));

    const std::string name = it->second.value("name", id);
    m_profiles.erase(it);
    if (m_active_profile == id)
    {
        clear_selection();
        remember_last_used_locked(std::nullopt);
    }
    m_status.info(fmt::format("Profile '{}' deleted", name));
    return ApiStatus::ok();
}

std::optional<std::string> ProfileStore::active_profile_id() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_active_profile;
}

std::optional<std::string> ProfileStore::active_device_id() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    return m_active_device;
}

// ---------------------------------------------------------------------------
// Devices
// ---------------------------------------------------------------------------

ApiResult<std::string> ProfileStore::add_device(const std::string &name, const DeviceGeometry &geometry)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    if (profile == nullptr)
        return fail<std::string>(ErrorKind::NoSelection, "select a profile before adding a device");

    const std::string clean = trimmed(name);
    if (clean.empty())
        return fail<std::string>(ErrorKind::Validation, "device name must not be empty");
    if (device_name_taken(*profile, clean, {}))
        return fail<std::string>(ErrorKind::Validation,
                                 fmt::format("a device named '{}' already exists in this profile", clean));
    if (auto why = check_geometry(geometry); !why.empty())
        return fail<std::string>(ErrorKind::Validation, why);

    const std::string id = uid::generate_uuid_v4();
    json device = {{"id", id}, {"name", clean}};
    write_geometry(device, geometry);

    json updated = *profile;
    updated["devices"].push_back(device);
    updated["last_selected_device_id"] = id;
    if (auto st = persist_locked(updated); st.is_error())
        return ApiResult<std::string>::error(st.error(), st.message());

    m_active_device = id;
    m_status.info(fmt::format("Device '{}' added", clean));
    return ApiResult<std::string>::ok(id);
}

ApiStatus ProfileStore::update_device(const json &device)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    if (profile == nullptr)
        return fail(ErrorKind::NoSelection, "no profile selected");
    if (auto st = broker::validate_record_identity(device); st.is_error())
    {
        m_status.error("[profiles] " + st.message());
        return st;
    }

    const std::string id = device["id"].get<std::string>();
    const std::string clean = trimmed(device["name"].get<std::string>());
    json updated = *profile;
    json *target = find_device(updated, id);
    if (target == nullptr)
        return fail(ErrorKind::Validation, fmt::format("unknown device id {}", id));
    if (clean.empty())
        return fail(ErrorKind::Validation, "device name must not be empty");
    if (device_name_taken(updated, clean, id))
        return fail(ErrorKind::Validation, fmt::format("a device named '{}' already exists in this profile", clean));

    const DeviceGeometry geometry = geometry_from_record(device);
    if (auto why = check_geometry(geometry); !why.empty())
        return fail(ErrorKind::Validation, why);

    *target = device;
    (*target)["name"] = clean;
    write_geometry(*target, geometry);
    if (auto st = persist_locked(updated); st.is_error())
        return st;
    m_status.info(fmt::format("Device '{}' updated", clean));
    return ApiStatus::ok();
}

ApiStatus ProfileStore::remove_device(const std::string &id)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    if (profile == nullptr)
        return fail(ErrorKind::NoSelection, "no profile selected");

    json updated = *profile;
    auto &devices = updated["devices"];
    const auto it = std::find_if(devices.begin(), devices.end(),
                                 [&](const json &d) { return d.value("id", std::string{}) == id; });
    if (it == devices.end())
        return fail(ErrorKind::Validation, fmt::format("unknown device id {}", id));

    const std::string name = it->value("name", id);
    devices.erase(it);
    if (updated.value("last_selected_device_id", json(nullptr)) == json(id))
        updated["last_selected_device_id"] = nullptr;
    if (auto st = persist_locked(updated); st.is_error())
        return st;

    m_status.info(fmt::format("Device '{}' removed", name));
    if (m_active_device == id)
        select_initial_device_locked();
    return ApiStatus::ok();
}

ApiStatus ProfileStore::select_device(const std::string &id)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    json *profile = active_locked();
    if (profile == nullptr)
        return fail(ErrorKind::NoSelection, "no profile selected");
    const json *device = find_device(*profile, id);
    if (device == nullptr)
        return fail(ErrorKind::Validation, fmt::format("unknown device id {}", id));

    const std::string name = device->value("name", id);
    m_active_device = id;
    if (auto st = set_last_device_locked(id); st.is_error())
        return st;
    m_status.info(fmt::format("Device '{}' selected", name));
    return ApiStatus::ok();
}

std::vector<json> ProfileStore::devices() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    if (profile == nullptr)
        return {};
    const auto &list = profile->at("devices");
    return std::vector<json>(list.begin(), list.end());
}

// ---------------------------------------------------------------------------
// ProfileOwner
// ---------------------------------------------------------------------------

std::optional<json> ProfileStore::active_record() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    return profile == nullptr ? std::nullopt : std::optional<json>(*profile);
}

ApiResult<json> ProfileStore::load_record(const std::string &id) const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const auto it = m_profiles.find(id);
    if (it == m_profiles.end())
        return broker::failure<json>(ErrorKind::Validation, fmt::format("unknown profile id {}", id));
    return ApiResult<json>::ok(it->second);
}

std::vector<broker::RecordSummary> ProfileStore::list_records() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    std::vector<broker::RecordSummary> out;
    out.reserve(m_profiles.size());
    for (const auto &[id, record] : m_profiles)
        out.push_back({id, record.value("name", std::string{})});
    std::sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
        return a.name != b.name ? a.name < b.name : a.id < b.id;
    });
    return out;
}

ApiStatus ProfileStore::save_record(const json &record)
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    if (auto st = broker::validate_record_identity(record); st.is_error())
    {
        m_status.error("[profiles] " + st.message());
        return st;
    }

    const std::string id = record["id"].get<std::string>();
    const std::string name = record["name"].get<std::string>();
    const auto existing = m_profiles.find(id);
    if (existing != m_profiles.end() && existing->second.value("name", std::string{}) != name)
        return fail(ErrorKind::Validation, "the profile name can only be changed by renaming");
    if (existing == m_profiles.end() && (trimmed(name) != name || name_taken_locked(name, id)))
        return fail(ErrorKind::Validation, fmt::format("invalid or duplicate profile name '{}'", name));

    json normalized = record;
    if (!normalized.contains("devices"))
        normalized["devices"] = json::array();
    if (!normalized["devices"].is_array())
        return fail(ErrorKind::Validation, "'devices' must be an array");
    for (auto &device : normalized["devices"])
    {
        if (auto st = broker::validate_record_identity(device); st.is_error())
        {
            m_status.error("[profiles] device " + st.message());
            return st;
        }
        write_geometry(device, geometry_from_record(device));
    }
    if (!normalized.contains("last_selected_device_id"))
        normalized["last_selected_device_id"] = nullptr;

    if (auto st = persist_locked(normalized); st.is_error())
        return st;

    if (m_active_profile == id && m_active_device && find_device(m_profiles[id], *m_active_device) == nullptr)
        select_initial_device_locked();
    m_status.info(fmt::format("Profile '{}' saved", name));
    return ApiStatus::ok();
}

std::optional<json> ProfileStore::active_device() const
{
    std::lock_guard<std::recursive_mutex> lock(m_mutex);
    const json *profile = active_locked();
    if (profile == nullptr || !m_active_device)
        return std::nullopt;
    for (const auto &device : profile->at("devices"))
    {
        if (device.value("id", std::string{}) == *m_active_device)
            return device;
    }
    return std::nullopt;
}

} // namespace elworkbench::modules
