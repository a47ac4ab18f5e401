#pragma once

#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/temporal_error_code.hpp>

#include <stdexcept>
#include <string>
#include <string_view>

namespace chronicle::errors {

/// Base of every failure raised by the temporal core. Each one aborts the
/// flush in progress; the caller owns the transaction and decides whether to
/// roll back and retry.
class temporal_error : public std::runtime_error {
 public:
  temporal_error(chronicle::schema::temporal_error_code code,
                 const std::string& message);

  chronicle::schema::temporal_error_code code() const noexcept {
    return code_;
  }

 private:
  chronicle::schema::temporal_error_code code_;
};

/// Ledger asked to advance to a timestamp before the open interval's start.
class out_of_order_error final : public temporal_error {
 public:
  out_of_order_error(const chronicle::schema::entity_id_t& entity_id,
                     chronicle::schema::timestamp_milliseconds_t open_start,
                     chronicle::schema::timestamp_milliseconds_t at_time);
};

/// Mandatory-scope entity mutated outside any recording scope.
class unscoped_mutation_error final : public temporal_error {
 public:
  unscoped_mutation_error(std::string entity_type,
                          const chronicle::schema::entity_id_t& entity_id,
                          std::string attribute);

  const std::string& entity_type() const noexcept { return entity_type_; }
  const chronicle::schema::entity_id_t& entity_id() const noexcept {
    return entity_id_;
  }
  const std::string& attribute() const noexcept { return attribute_; }

 private:
  std::string entity_type_;
  chronicle::schema::entity_id_t entity_id_;
  std::string attribute_;
};

class scope_misuse_error final : public temporal_error {
 public:
  explicit scope_misuse_error(const std::string& message);
};

class concurrent_modification_error final : public temporal_error {
 public:
  explicit concurrent_modification_error(const std::string& message);
};

/// Composite group with some, but not all, member values resolvable.
class composite_integrity_error final : public temporal_error {
 public:
  composite_integrity_error(std::string unit, std::string missing_member);

  const std::string& unit() const noexcept { return unit_; }
  const std::string& missing_member() const noexcept { return missing_member_; }

 private:
  std::string unit_;
  std::string missing_member_;
};

class delete_forbidden_error final : public temporal_error {
 public:
  delete_forbidden_error(std::string_view entity_type,
                         const chronicle::schema::entity_id_t& entity_id);
};

class missing_activity_error final : public temporal_error {
 public:
  missing_activity_error(std::string_view entity_type,
                         const chronicle::schema::entity_id_t& entity_id);
};

class duplicate_activity_error final : public temporal_error {
 public:
  duplicate_activity_error(const chronicle::schema::entity_id_t& entity_id,
                           const chronicle::schema::activity_id_t& activity_id);
};

class unknown_attribute_error final : public temporal_error {
 public:
  unknown_attribute_error(std::string_view entity_type,
                          std::string_view attribute);
};

class entity_exists_error final : public temporal_error {
 public:
  entity_exists_error(std::string_view entity_type,
                      const chronicle::schema::entity_id_t& entity_id);
};

class entity_missing_error final : public temporal_error {
 public:
  entity_missing_error(std::string_view entity_type,
                       const chronicle::schema::entity_id_t& entity_id);
};

/// Store statement failure that is not a write conflict.
class storage_error final : public temporal_error {
 public:
  explicit storage_error(const std::string& message);
};

}  // namespace chronicle::errors
