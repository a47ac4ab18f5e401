#pragma once

#include <chronicle/schema/encoding/scale/encoder.hpp>
#include <chronicle/schema/entity_record.hpp>
#include <chronicle/schema/primitives.hpp>
#include <chronicle/schema/registry.hpp>
#include <chronicle/storage/rocksdb/transaction.hpp>
#include <optional>

namespace chronicle::temporal {

/// Current-state row of each entity: its vclock and the values it was last
/// flushed with. Loading an entity reads it; every flush rewrites it.
class entity_snapshot final {
 public:
  entity_snapshot(chronicle::schema::encoding::scale_encoder_t& encoder,
                  chronicle::storage::rocksdb_transaction_t& transaction);

  /// With for_update the row joins this transaction's commit-time conflict
  /// check.
  std::optional<chronicle::schema::entity_record_t> get(
      const chronicle::schema::registered_type& type,
      const chronicle::schema::entity_id_t& entity_id,
      bool for_update = false);

  void put(const chronicle::schema::registered_type& type,
           const chronicle::schema::entity_id_t& entity_id,
           chronicle::schema::vclock_t vclock,
           const chronicle::schema::attribute_values_t& values);

 private:
  chronicle::schema::encoding::scale_encoder_t& encoder_;
  chronicle::storage::rocksdb_transaction_t& transaction_;
};

chronicle::schema::attribute_values_t to_attribute_values(
    const chronicle::schema::entity_record_t& record);

}  // namespace chronicle::temporal
