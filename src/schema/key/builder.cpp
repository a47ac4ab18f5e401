#include <algorithm>
#include <chronicle/blake3/hash.hpp>
#include <chronicle/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace chronicle::schema;
using namespace chronicle::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(std::span<const uint8_t>{hash.data(), hash.size()});
}

builder& builder::hash(const std::string_view& str) {
  return write(chronicle::blake3::hash(str));
}
