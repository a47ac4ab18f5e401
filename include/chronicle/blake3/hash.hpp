#pragma once
#include <chronicle/schema/primitives.hpp>
#include <string_view>

namespace chronicle::blake3 {

chronicle::schema::hash32_t hash(const std::string_view& str);

}  // namespace chronicle::blake3
