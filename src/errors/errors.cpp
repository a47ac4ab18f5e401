#include <chronicle/errors/errors.hpp>

#include <fmt/format.h>

#include <utility>

using chronicle::schema::temporal_error_code;
using chronicle::schema::to_hex;

namespace chronicle::errors {

temporal_error::temporal_error(temporal_error_code code,
                               const std::string& message)
    : std::runtime_error{message}, code_{code} {}

out_of_order_error::out_of_order_error(
    const chronicle::schema::entity_id_t& entity_id,
    chronicle::schema::timestamp_milliseconds_t open_start,
    chronicle::schema::timestamp_milliseconds_t at_time)
    : temporal_error{temporal_error_code::out_of_order,
                     fmt::format("clock for entity {} cannot advance to {} "
                                 "before open tick start {}",
                                 to_hex(entity_id), at_time, open_start)} {}

unscoped_mutation_error::unscoped_mutation_error(
    std::string entity_type,
    const chronicle::schema::entity_id_t& entity_id,
    std::string attribute)
    : temporal_error{temporal_error_code::unscoped_mutation,
                     fmt::format("{} {} attribute '{}' was changed outside a "
                                 "recording scope",
                                 entity_type, to_hex(entity_id), attribute)},
      entity_type_{std::move(entity_type)},
      entity_id_{entity_id},
      attribute_{std::move(attribute)} {}

scope_misuse_error::scope_misuse_error(const std::string& message)
    : temporal_error{temporal_error_code::scope_misuse, message} {}

concurrent_modification_error::concurrent_modification_error(
    const std::string& message)
    : temporal_error{temporal_error_code::concurrent_modification, message} {}

composite_integrity_error::composite_integrity_error(std::string unit,
                                                     std::string missing_member)
    : temporal_error{temporal_error_code::composite_integrity,
                     fmt::format("composite '{}' has no value for member '{}'",
                                 unit, missing_member)},
      unit_{std::move(unit)},
      missing_member_{std::move(missing_member)} {}

delete_forbidden_error::delete_forbidden_error(
    std::string_view entity_type,
    const chronicle::schema::entity_id_t& entity_id)
    : temporal_error{temporal_error_code::delete_forbidden,
                     fmt::format("cannot delete temporal entity {} {}",
                                 entity_type, to_hex(entity_id))} {}

missing_activity_error::missing_activity_error(
    std::string_view entity_type,
    const chronicle::schema::entity_id_t& entity_id)
    : temporal_error{temporal_error_code::missing_activity,
                     fmt::format("{} {} requires an activity for every clock "
                                 "tick",
                                 entity_type, to_hex(entity_id))} {}

duplicate_activity_error::duplicate_activity_error(
    const chronicle::schema::entity_id_t& entity_id,
    const chronicle::schema::activity_id_t& activity_id)
    : temporal_error{temporal_error_code::duplicate_activity,
                     fmt::format("activity {} already stamped a tick of "
                                 "entity {}",
                                 to_hex(activity_id), to_hex(entity_id))} {}

unknown_attribute_error::unknown_attribute_error(std::string_view entity_type,
                                                 std::string_view attribute)
    : temporal_error{temporal_error_code::unknown_attribute,
                     fmt::format("{} has no tracked attribute '{}'",
                                 entity_type, attribute)} {}

entity_exists_error::entity_exists_error(
    std::string_view entity_type,
    const chronicle::schema::entity_id_t& entity_id)
    : temporal_error{temporal_error_code::entity_exists,
                     fmt::format("{} {} already exists", entity_type,
                                 to_hex(entity_id))} {}

entity_missing_error::entity_missing_error(
    std::string_view entity_type,
    const chronicle::schema::entity_id_t& entity_id)
    : temporal_error{temporal_error_code::entity_missing,
                     fmt::format("{} {} does not exist", entity_type,
                                 to_hex(entity_id))} {}

storage_error::storage_error(const std::string& message)
    : temporal_error{temporal_error_code::storage_failure, message} {}

}  // namespace chronicle::errors
