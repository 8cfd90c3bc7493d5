#pragma once
#include <scrip/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace scrip::storage {

using key_value_entry_t =
    std::pair<scrip::schema::bytes_t, scrip::schema::bytes_t>;

/// A set of puts and deletes applied atomically by `write`.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<scrip::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

/// Durable key-value store for engine state, selected by library tag.
///
/// Every mutation is synced before it returns. Read or write failures of the
/// backend are infrastructure faults and terminate through
/// scrip::common::critical.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing. A value
  /// that does not decode as T is treated as corruption.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const scrip::schema::bytes_view_t& key) const;

  /// Encode and persist a single value.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const scrip::schema::bytes_view_t& key,
           const T& value) const;

  /// Remove key; missing keys are not an error.
  void erase(const scrip::schema::bytes_view_t& key) const;

  /// Apply all puts and deletes in one atomic, synced write.
  void write(const write_set& writes) const;

  /// All key-value pairs under `prefix`, in key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const scrip::schema::bytes_view_t& prefix) const;

  std::optional<std::string> get_raw(
      const scrip::schema::bytes_view_t& key) const;
};

/// Open (creating if needed) the store rooted at `path`.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace scrip::storage
