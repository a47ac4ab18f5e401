#pragma once

#include <chronicle/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: temporal error code.
// Stable numeric identity of every failure the flush path can raise.
namespace chronicle::schema {

enum class temporal_error_code : uint32_t {
  out_of_order = 1,
  unscoped_mutation = 2,
  scope_misuse = 3,
  concurrent_modification = 4,
  composite_integrity = 5,
  delete_forbidden = 10,
  missing_activity = 11,
  duplicate_activity = 12,
  unknown_attribute = 13,
  entity_exists = 14,
  entity_missing = 15,
  storage_failure = 20,
};

inline constexpr auto kTemporalErrorCodeMappings = std::array{
    std::pair<std::string_view, temporal_error_code>{
        "out_of_order", temporal_error_code::out_of_order},
    std::pair<std::string_view, temporal_error_code>{
        "unscoped_mutation", temporal_error_code::unscoped_mutation},
    std::pair<std::string_view, temporal_error_code>{
        "scope_misuse", temporal_error_code::scope_misuse},
    std::pair<std::string_view, temporal_error_code>{
        "concurrent_modification",
        temporal_error_code::concurrent_modification},
    std::pair<std::string_view, temporal_error_code>{
        "composite_integrity", temporal_error_code::composite_integrity},
    std::pair<std::string_view, temporal_error_code>{
        "delete_forbidden", temporal_error_code::delete_forbidden},
    std::pair<std::string_view, temporal_error_code>{
        "missing_activity", temporal_error_code::missing_activity},
    std::pair<std::string_view, temporal_error_code>{
        "duplicate_activity", temporal_error_code::duplicate_activity},
    std::pair<std::string_view, temporal_error_code>{
        "unknown_attribute", temporal_error_code::unknown_attribute},
    std::pair<std::string_view, temporal_error_code>{
        "entity_exists", temporal_error_code::entity_exists},
    std::pair<std::string_view, temporal_error_code>{
        "entity_missing", temporal_error_code::entity_missing},
    std::pair<std::string_view, temporal_error_code>{
        "storage_failure", temporal_error_code::storage_failure}};

template <>
inline std::optional<temporal_error_code> try_from_string<temporal_error_code>(
    const std::string_view value) {
  return from_string(value, kTemporalErrorCodeMappings);
}

inline constexpr std::string_view to_string(const temporal_error_code value) {
  return to_string(value, kTemporalErrorCodeMappings).value_or("unknown");
}

}  // namespace chronicle::schema
