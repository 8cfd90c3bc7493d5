#pragma once

#include <scrip/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Every key is SCALE(prefix) followed by SCALE(id fields), so a prefix scan
// over SCALE(prefix) yields exactly one keyspace.
namespace scrip::schema::key {

inline constexpr std::string_view kCertificateKeyPrefix{
    "SYS|STATE|CERTIFICATE|"};
inline constexpr std::string_view kClaimKeyPrefix{"SYS|STATE|CLAIM|"};
inline constexpr std::string_view kCondenserKeyPrefix{"SYS|STATE|CONDENSER|"};
inline constexpr std::string_view kEventSeqKeyPrefix{"SYS|STATE|EVENT_SEQ|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

template <typename Encoder, typename T>
scrip::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                         std::string_view prefix,
                                         const T& id) {
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
scrip::schema::bytes_t make_prefix_key(Encoder& encoder,
                                       std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
scrip::schema::bytes_t make_certificate_key(
    Encoder& encoder,
    const scrip::schema::certificate_id_t& certificate_id) {
  return make_prefixed_key(encoder, kCertificateKeyPrefix, certificate_id);
}

template <typename Encoder>
scrip::schema::bytes_t make_claim_key(
    Encoder& encoder,
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& holder) {
  return make_prefixed_key(encoder, kClaimKeyPrefix,
                           std::tuple{certificate_id, holder});
}

template <typename Encoder>
scrip::schema::bytes_t make_condenser_key(
    Encoder& encoder,
    const scrip::schema::address_t& delegate) {
  return make_prefixed_key(encoder, kCondenserKeyPrefix, delegate);
}

template <typename Encoder>
scrip::schema::bytes_t make_event_sequence_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kEventSeqKeyPrefix,
                           std::string_view{"NEXT"});
}

template <typename Encoder>
scrip::schema::bytes_t make_event_key(Encoder& encoder, uint64_t sequence) {
  return make_prefixed_key(encoder, kEventPrefix, sequence);
}

template <typename Encoder>
std::optional<uint64_t> parse_event_key(
    Encoder& encoder,
    const scrip::schema::bytes_view_t& key) {
  auto decoded =
      encoder.template try_decode<std::tuple<std::string, uint64_t>>(key);
  if (!decoded || std::get<0>(*decoded) != kEventPrefix) {
    return std::nullopt;
  }
  return std::get<1>(*decoded);
}

}  // namespace scrip::schema::key
