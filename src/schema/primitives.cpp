#include <chronicle/common/critical.hpp>
#include <chronicle/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace chronicle::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> decode_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

}  // namespace

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    chronicle::common::critical("make_hash32 expected 32 bytes, got {}",
                                bytes.size());
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    chronicle::common::critical(
        "make_hash32 expected 64 hex characters, got {}", hex.size());
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = decode_hex(hex);
  if (!decoded || decoded->size() != 32) {
    return std::nullopt;
  }
  auto hash = hash32_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(hash));
  return hash;
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

std::string describe(const value_t& value) {
  if (!value) {
    return "null";
  }
  return std::visit(
      overloaded{[](const bool arg) -> std::string {
                   return arg ? "true" : "false";
                 },
                 [](const int64_t arg) { return std::to_string(arg); },
                 [](const uint64_t arg) { return std::to_string(arg) + "u"; },
                 [](const std::string& arg) { return "\"" + arg + "\""; },
                 [](const bytes_t& arg) {
                   return "0x" + to_hex(bytes_view_t{arg.data(), arg.size()});
                 }},
      *value);
}

std::string describe(const unit_values_t& values) {
  if (values.size() == 1) {
    return describe(values.front());
  }
  auto out = std::string{"("};
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.append(", ");
    }
    out.append(describe(values[i]));
  }
  out.push_back(')');
  return out;
}

}  // namespace chronicle::schema
