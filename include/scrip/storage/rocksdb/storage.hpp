#pragma once
#include <rocksdb/db.h>
#include <scrip/common/critical.hpp>
#include <scrip/schema/encoding/scale/encoder.hpp>
#include <scrip/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace scrip::storage {

struct rocksdb_storage_tag {};

/// Marker written on first open; a database carrying a different marker was
/// produced by an incompatible key or value layout.
inline constexpr std::string_view kFormatMarkerKey{"SYS|META|FORMAT"};
inline constexpr std::string_view kFormatMarker{"scrip-state/1"};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const scrip::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const scrip::schema::bytes_view_t& key,
           const T& value) const;

  void erase(const scrip::schema::bytes_view_t& key) const;
  void write(const write_set& writes) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const scrip::schema::bytes_view_t& prefix) const;

  /// Raw value at key, without decoding.
  std::optional<std::string> get_raw(
      const scrip::schema::bytes_view_t& key) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const scrip::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(scrip::schema::make_bytes_view(
      std::string_view{value->data(), value->size()}));
  if (!decoded) {
    scrip::common::critical("corrupt value stored under key {}",
                            scrip::schema::to_hex(key));
  }
  return decoded;
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const scrip::schema::bytes_view_t& key,
                                       const T& value) const {
  auto writes = write_set{};
  writes.puts.emplace_back(scrip::schema::bytes_t{std::begin(key), std::end(key)},
                           encoder.encode(value));
  write(writes);
}

}  // namespace scrip::storage
