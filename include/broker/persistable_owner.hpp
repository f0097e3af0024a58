#pragma once
/**
 * @file persistable_owner.hpp
 * @brief The narrow interface a capability API uses to reach the module that
 *        owns a persistent data domain.
 *
 * Capability APIs never write storage. They hold a non-owning reference to a
 * PersistableOwner and delegate; the owner validates, persists atomically,
 * updates its cache and reports I/O faults on the status channel.
 *
 * Every record crossing this interface is a JSON object with an `id`
 * (UUID v4 string) and a non-empty `name`.
 */

#include "broker/errors.hpp"

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace elworkbench::broker
{

struct RecordSummary
{
    std::string id;
    std::string name;
};

class PersistableOwner
{
  public:
    virtual ~PersistableOwner() = default;

    /// Copy of the currently selected record, if any.
    [[nodiscard]] virtual std::optional<nlohmann::json> active_record() const = 0;

    /// Copy of the record with @p id; ValidationError if unknown.
    [[nodiscard]] virtual ApiResult<nlohmann::json> load_record(const std::string &id) const = 0;

    /// Sorted by name.
    [[nodiscard]] virtual std::vector<RecordSummary> list_records() const = 0;

    /**
     * @brief Persist @p record, creating or replacing the record with its id.
     *
     * Changing the name of an existing record through save is refused; use
     * rename_record().
     */
    virtual ApiStatus save_record(const nlohmann::json &record) = 0;

    virtual ApiStatus rename_record(const std::string &id, const std::string &new_name) = 0;
};

/// A PersistableOwner whose records contain selectable devices.
class ProfileOwner : public PersistableOwner
{
  public:
    [[nodiscard]] virtual std::optional<nlohmann::json> active_device() const = 0;
};

/**
 * @brief Check the identity fields of @p record.
 * @return MalformedRecordError failure if @p record is not an object, has no
 *         string `id` in UUID v4 form, or no non-empty string `name`.
 */
ApiStatus validate_record_identity(const nlohmann::json &record);

} // namespace elworkbench::broker
