#pragma once

#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: entity record.
// Current state of an entity as of its last flush: the baseline the change
// detector compares pending values against after a load.
namespace chronicle::schema {

struct attribute_value final {
  std::string name;
  value_t value;
};

template <uint16_t Version>
struct entity_record;

template <>
struct entity_record<1> final {
  uint16_t version{1};
  entity_id_t entity_id{};
  vclock_t vclock{};
  std::vector<attribute_value> values;
};

using entity_record_t = entity_record<1>;

}  // namespace chronicle::schema
