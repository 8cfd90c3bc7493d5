#pragma once
#include <scrip/schema/primitives.hpp>
#include <optional>

namespace scrip::schema::encoding {

/// Codec for persisted values and storage keys, selected by library tag.
///
/// Identity hashes never pass through here; their byte layout is fixed by
/// scrip/identity/hasher.hpp and must not change with the storage codec.
template <typename Library>
struct encoder {
  /// Decode, returning std::nullopt on malformed input.
  template <typename T>
  std::optional<T> try_decode(const scrip::schema::bytes_view_t& bytes);

  /// Decode input the engine wrote itself; malformed bytes are fatal.
  template <typename T>
  T decode(const scrip::schema::bytes_view_t& bytes);

  template <typename T>
  scrip::schema::bytes_t encode(const T& obj);

  /// Append the encoding of `obj` to `out`.
  template <typename T>
  void encode(const T& obj, scrip::schema::bytes_t& out);
};

}  // namespace scrip::schema::encoding
