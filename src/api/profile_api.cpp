#include "api/profile_api.hpp"
#include "broker/broker.hpp"
#include "utils/Logger.hpp"

namespace elworkbench::api
{

using broker::ApiStatus;
using broker::ErrorKind;
using nlohmann::json;

ProfileApi::ProfileApi(broker::Broker &broker, broker::ProfileOwner &owner)
    : CapabilityApi(kCapabilityName, broker), m_owner(owner)
{
}

std::optional<json> ProfileApi::current_profile() const
{
    return m_owner.active_record();
}

json ProfileApi::profile_attribute(const std::string &key, const json &default_value) const
{
    const auto profile = m_owner.active_record();
    if (!profile)
        return default_value;
    const auto it = profile->find(key);
    return it == profile->end() ? default_value : *it;
}

ApiStatus ProfileApi::set_profile_attribute(const std::string &key, const json &value)
{
    auto profile = m_owner.active_record();
    if (!profile)
        return report_failure(ErrorKind::NoSelection, "no profile selected to set '" + key + "' on");
    if (key.empty())
        return report_failure(ErrorKind::Validation, "attribute key must not be empty");
    if (key == "id")
        return report_failure(ErrorKind::Validation, "the profile id cannot be changed");
    if (key == "name")
    {
        if (!value.is_string())
            return report_failure(ErrorKind::Validation, "profile name must be a string");
        return rename_profile(value.get<std::string>());
    }

    (*profile)[key] = value;
    auto st = m_owner.save_record(*profile);
    if (st.is_ok())
        LOGGER_DEBUG("ProfileApi: attribute '{}' set to {}", key, value.dump());
    return st;
}

ApiStatus ProfileApi::save_profile(const json &record)
{
    if (auto st = broker::validate_record_identity(record); st.is_error())
    {
        status().error("[" + name() + "] " + st.message());
        return st;
    }
    return m_owner.save_record(record);
}

ApiStatus ProfileApi::rename_profile(const std::string &new_name)
{
    const auto profile = m_owner.active_record();
    if (!profile)
        return report_failure(ErrorKind::NoSelection, "no profile selected to rename");
    return m_owner.rename_record(profile->at("id").get<std::string>(), new_name);
}

std::vector<broker::RecordSummary> ProfileApi::list_profiles() const
{
    return m_owner.list_records();
}

std::optional<json> ProfileApi::current_device() const
{
    return m_owner.active_device();
}

json ProfileApi::device_attribute(const std::string &key, const json &default_value) const
{
    const auto device = m_owner.active_device();
    if (!device)
        return default_value;
    const auto it = device->find(key);
    return it == device->end() ? default_value : *it;
}

double ProfileApi::device_area_m2() const
{
    const json area = device_attribute("Area", 0.0);
    return area.is_number() ? area.get<double>() : 0.0;
}

bool ProfileApi::is_profile_selected() const
{
    return m_owner.active_record().has_value();
}

bool ProfileApi::is_device_selected() const
{
    return m_owner.active_device().has_value();
}

std::string ProfileApi::profile_name() const
{
    const json name = profile_attribute("name");
    return name.is_string() ? name.get<std::string>() : "No profile";
}

std::string ProfileApi::device_name() const
{
    const json name = device_attribute("name");
    return name.is_string() ? name.get<std::string>() : "No device";
}

} // namespace elworkbench::api
