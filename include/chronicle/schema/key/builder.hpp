#pragma once
#include <boost/endian/buffers.hpp>
#include <chronicle/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace chronicle::schema::key {

struct builder final {
  chronicle::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const hash32_t& hash);

  builder& hash(const std::string_view& str);

  /// Big-endian so that byte-wise key order matches numeric order.
  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write_ordered(T value) {
    auto buffer =
        boost::endian::endian_buffer<boost::endian::order::big, T,
                                     sizeof(T) * 8>{value};
    return write(std::span<const uint8_t>{
        reinterpret_cast<const uint8_t*>(buffer.data()), sizeof(T)});
  }
};

}  // namespace chronicle::schema::key
