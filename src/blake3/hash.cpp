#include <blake3.h>
#include <chronicle/blake3/hash.hpp>

namespace chronicle::blake3 {

chronicle::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  auto output = chronicle::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<decltype(output)>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace chronicle::blake3
