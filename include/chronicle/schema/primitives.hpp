#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace chronicle::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using entity_id_t = hash32_t;
using activity_id_t = hash32_t;
using timestamp_milliseconds_t = uint64_t;
using vclock_t = uint64_t;

/// A concrete attribute value. Variant order is part of the persisted row
/// format; append only.
using scalar_t = std::variant<bool, int64_t, uint64_t, std::string, bytes_t>;

/// Attribute value as seen by the history machinery. std::nullopt is an
/// explicit null, which is a recorded value (unlike an unset attribute, which
/// is simply absent from an attribute_values_t).
using value_t = std::optional<scalar_t>;

/// Member values of one tracked unit, in declaration order.
using unit_values_t = std::vector<value_t>;

/// Attribute name -> value. Unset attributes have no entry.
using attribute_values_t = std::map<std::string, value_t>;

bytes_t make_bytes(const std::string& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);

std::string make_string(const bytes_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);

/// Human-readable rendering for logs, error messages and the inspect tool.
std::string describe(const value_t& value);
std::string describe(const unit_values_t& values);

}  // namespace chronicle::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
