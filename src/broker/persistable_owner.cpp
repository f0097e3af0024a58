#include "broker/persistable_owner.hpp"
#include "utils/uid_utils.hpp"

namespace elworkbench::broker
{

ApiStatus validate_record_identity(const nlohmann::json &record)
{
    if (!record.is_object())
        return failure(ErrorKind::MalformedRecord, "record is not a JSON object");

    const auto id = record.find("id");
    if (id == record.end() || id->is_null())
        return failure(ErrorKind::MalformedRecord, "record has no 'id'");
    if (!id->is_string() || !uid::is_uuid_v4(id->get_ref<const std::string &>()))
        return failure(ErrorKind::MalformedRecord,
                       "record 'id' " + id->dump() + " is not a UUID v4 string");

    const auto name = record.find("name");
    if (name == record.end() || !name->is_string() ||
        name->get_ref<const std::string &>().empty())
        return failure(ErrorKind::MalformedRecord,
                       "record " + id->get<std::string>() + " has no non-empty 'name'");

    return ApiStatus::ok();
}

} // namespace elworkbench::broker
