#include <algorithm>
#include <iterator>
#include <ranges>
#include <scrip/blake3/hash.hpp>
#include <scrip/common/critical.hpp>
#include <scrip/schema/key/builder.hpp>

using namespace scrip::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const scrip::schema::amount_t& amount) {
  auto remaining = amount;
  for (size_t i = 0; i < 32; ++i) {
    auto low = scrip::schema::amount_t{remaining & 0xFF};
    data.push_back(low.convert_to<uint8_t>());
    remaining >>= 8;
  }
  return *this;
}

builder& builder::write_sized(const std::span<const uint8_t>& bytes) {
  if (bytes.size() > UINT32_MAX) {
    scrip::common::critical("field too large for u32 length prefix");
  }
  write(static_cast<uint32_t>(bytes.size()));
  return write(bytes);
}

scrip::schema::hash32_t builder::hash() const {
  return scrip::blake3::hash(std::span<const uint8_t>{data.data(), data.size()});
}
