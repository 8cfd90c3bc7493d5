#pragma once
#include <scrip/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace scrip::schema::key {

/// Byte-exact material builder for hashed identifiers.
///
/// Integers are written fixed-width little-endian; amounts always occupy 32
/// bytes. Variable-length fields must be preceded by an explicit length
/// (`write_sized`) so that adjacent fields cannot be re-split.
struct builder final {
  scrip::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const scrip::schema::amount_t& amount);
  builder& write_sized(const std::span<const uint8_t>& bytes);

  scrip::schema::hash32_t hash() const;

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }
};

}  // namespace scrip::schema::key
