#pragma once
/**
 * @file profile_api.hpp
 * @brief Capability "profile": read access to the selected profile and device,
 *        write access delegated to the owning module.
 *
 * Getters return copies. Setters never touch storage; they go through the
 * ProfileOwner handed in at construction, which must outlive this API.
 */

#include "broker/capability_api.hpp"
#include "broker/persistable_owner.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace elworkbench::api
{

class ProfileApi final : public broker::CapabilityApi
{
  public:
    static constexpr const char *kCapabilityName = "profile";

    ProfileApi(broker::Broker &broker, broker::ProfileOwner &owner);

    // --- profile ---
    [[nodiscard]] std::optional<nlohmann::json> current_profile() const;
    [[nodiscard]] nlohmann::json profile_attribute(const std::string &key,
                                                   const nlohmann::json &default_value = nullptr) const;

    /**
     * @brief Set or add one attribute of the selected profile and persist it.
     *
     * `id` is immutable (ValidationError); `name` is routed to a rename.
     */
    broker::ApiStatus set_profile_attribute(const std::string &key, const nlohmann::json &value);

    /// Persist a whole record; identity is validated before the owner sees it.
    broker::ApiStatus save_profile(const nlohmann::json &record);
    broker::ApiStatus rename_profile(const std::string &new_name);
    [[nodiscard]] std::vector<broker::RecordSummary> list_profiles() const;

    // --- device ---
    [[nodiscard]] std::optional<nlohmann::json> current_device() const;
    [[nodiscard]] nlohmann::json device_attribute(const std::string &key,
                                                  const nlohmann::json &default_value = nullptr) const;
    /// `Area` of the selected device in m², 0 when none is selected.
    [[nodiscard]] double device_area_m2() const;

    [[nodiscard]] bool is_profile_selected() const;
    [[nodiscard]] bool is_device_selected() const;
    /// "No profile" when nothing is selected.
    [[nodiscard]] std::string profile_name() const;
    /// "No device" when nothing is selected.
    [[nodiscard]] std::string device_name() const;

  private:
    broker::ProfileOwner &m_owner;
};

} // namespace elworkbench::api
