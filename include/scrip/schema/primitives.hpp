#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace scrip::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using certificate_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;

/// secp256k1 secret scalar, big-endian.
using private_key_t = std::array<uint8_t, 32>;
/// Uncompressed SEC1 public key: 0x04 || X || Y.
using public_key_t = std::array<uint8_t, 65>;
/// Recoverable signature: r || s || v.
using recoverable_signature_t = std::array<uint8_t, 65>;

bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Lowercase hex without a prefix.
std::string to_hex(const bytes_view_t& bytes);
/// Accepts an optional 0x prefix; odd length or non-hex digits yield nullopt.
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Fixed-width parsers. The throwing-free `try_` forms are for untrusted
/// input; the others treat malformed input as a fatal configuration error.
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);

/// Parse a decimal (or 0x-prefixed hex) unsigned amount.
std::optional<amount_t> try_make_amount(const std::string_view& text);
std::string to_string(const amount_t& amount);

template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

}  // namespace scrip::schema
