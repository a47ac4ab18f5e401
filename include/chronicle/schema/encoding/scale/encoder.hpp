#pragma once
#include <chronicle/common/critical.hpp>
#include <chronicle/schema/encoding/encoder.hpp>
#include <chronicle/schema/encoding/scale/clock_record.hpp>
#include <chronicle/schema/encoding/scale/entity_record.hpp>
#include <chronicle/schema/encoding/scale/history_row.hpp>
#include <scale/scale.hpp>

namespace chronicle::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  chronicle::schema::bytes_t encode(const T& obj);

  template <typename T>
  T decode(const chronicle::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
chronicle::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    chronicle::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const chronicle::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    chronicle::common::critical("failed to decode {} SCALE bytes",
                                bytes.size());
  }
  return decoded.value();
}

}  // namespace chronicle::schema::encoding
