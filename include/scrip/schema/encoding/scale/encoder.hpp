#pragma once
#include <scrip/common/critical.hpp>
#include <scrip/schema/encoding/encoder.hpp>
#include <scrip/schema/encoding/scale/certificate_state.hpp>
#include <scrip/schema/encoding/scale/claim_record.hpp>
#include <scrip/schema/encoding/scale/event.hpp>
#include <scrip/schema/encoding/scale/event_attribute.hpp>
#include <iterator>
#include <utility>
#include <scale/scale.hpp>

namespace scrip::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec over the qdrvm implementation. Record types are found through
/// the encode/decode overloads in scrip::schema::encoding::scale.
template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  std::optional<T> try_decode(const scrip::schema::bytes_view_t& bytes) {
    auto decoded = ::scale::impl::memory::decode<T>(bytes);
    if (!decoded) {
      return std::nullopt;
    }
    return std::move(decoded.value());
  }

  template <typename T>
  T decode(const scrip::schema::bytes_view_t& bytes) {
    auto decoded = try_decode<T>(bytes);
    if (!decoded) {
      scrip::common::critical("Undecodable SCALE value ({} bytes)",
                              bytes.size());
    }
    return std::move(*decoded);
  }

  template <typename T>
  scrip::schema::bytes_t encode(const T& obj) {
    auto encoded = ::scale::impl::memory::encode(obj);
    if (!encoded) {
      scrip::common::critical("SCALE encoding failed");
    }
    return std::move(encoded.value());
  }

  template <typename T>
  void encode(const T& obj, scrip::schema::bytes_t& out) {
    auto encoded = encode(obj);
    out.insert(std::end(out), std::begin(encoded), std::end(encoded));
  }
};

using scale_encoder_t = encoder<scale_encoder_tag>;

}  // namespace scrip::schema::encoding
