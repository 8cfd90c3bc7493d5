#include <boost/algorithm/hex.hpp>
#include <scrip/common/critical.hpp>
#include <scrip/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>

namespace scrip::schema {

namespace {

bool has_hex_prefix(const std::string_view text) {
  return text.size() >= 2 && text[0] == '0' &&
         (text[1] == 'x' || text[1] == 'X');
}

bool is_hex_digit(const char c) {
  return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') ||
         (c >= 'A' && c <= 'F');
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(
    const std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::ranges::copy(*decoded, std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (has_hex_prefix(hex)) {
    hex.remove_prefix(2);
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(hex), std::end(hex),
                            std::back_inserter(decoded));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return decoded;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    scrip::common::critical("invalid hash32 hex '{}'", hex);
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address) {
    scrip::common::critical("invalid address hex '{}'", hex);
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

std::optional<amount_t> try_make_amount(const std::string_view& text) {
  auto hex = has_hex_prefix(text);
  auto digits = hex ? text.substr(2) : text;
  if (digits.empty()) {
    return std::nullopt;
  }
  auto valid = hex ? std::ranges::all_of(digits, is_hex_digit)
                   : std::ranges::all_of(digits, [](const char c) {
                       return c >= '0' && c <= '9';
                     });
  if (!valid) {
    return std::nullopt;
  }

  // uint256_t wraps on overflow; range-check in the unbounded type.
  auto parsed = boost::multiprecision::cpp_int{std::string{text}};
  if (parsed > boost::multiprecision::cpp_int{
                   std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return amount_t{parsed};
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace scrip::schema
