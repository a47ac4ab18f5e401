#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/temporal/change_set.hpp>
#include <chronicle/temporal/entity.hpp>

namespace chronicle::temporal {

/// Compare pending values against the last flushed baseline, unit by unit.
///
/// A unit whose members are all unset in pending is not reported. A composite
/// with some members set and others unset (in pending, or in a non-empty
/// baseline) raises composite_integrity_error. Pure: no I/O.
change_set_t diff(const chronicle::schema::registered_type& type,
                  const chronicle::schema::attribute_values_t& baseline,
                  const chronicle::schema::attribute_values_t& pending);

/// diff() of an entity's current values against its baseline.
change_set_t diff(const entity& target);

}  // namespace chronicle::temporal
