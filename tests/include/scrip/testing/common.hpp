#pragma once

#include <scrip/crypto/signature.hpp>
#include <scrip/identity/hasher.hpp>
#include <scrip/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace scrip::testing {

inline scrip::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = scrip::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline scrip::schema::address_t make_address(const uint8_t seed) {
  auto out = scrip::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed ^ static_cast<uint8_t>(i * 7));
  }
  return out;
}

/// Keys derived from small seeds; the leading byte stays far below the curve
/// order and the key is never zero.
inline scrip::schema::private_key_t make_private_key(const uint8_t seed) {
  auto key = make_hash(seed);
  key[0] = static_cast<uint8_t>(0x10 + (seed & 0x0F));
  return key;
}

struct test_signer final {
  scrip::schema::private_key_t private_key{};
  scrip::schema::address_t address{};
};

inline test_signer make_signer(const uint8_t seed) {
  auto signer = test_signer{.private_key = make_private_key(seed)};
  signer.address =
      scrip::crypto::derive_address(signer.private_key).value_or(
          scrip::schema::address_t{});
  return signer;
}

inline scrip::schema::bytes_t sign_hash(const test_signer& signer,
                                        const scrip::schema::hash32_t& hash) {
  auto signature = scrip::crypto::sign(signer.private_key, hash);
  if (!signature) {
    return {};
  }
  return scrip::schema::bytes_t{std::begin(*signature), std::end(*signature)};
}

inline scrip::schema::bytes_t sign_redemption(
    const test_signer& signer,
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& service,
    const scrip::schema::address_t& holder) {
  return sign_hash(signer, scrip::identity::compute_redemption_hash(
                               certificate_id, service, holder));
}

inline scrip::schema::bytes_t sign_condensed(
    const test_signer& signer,
    const std::vector<scrip::schema::certificate_id_t>& certificate_ids,
    const scrip::schema::amount_t& combined_amount,
    const scrip::schema::address_t& service,
    const scrip::schema::address_t& holder) {
  return sign_hash(signer,
                   scrip::identity::compute_condensed_redemption_hash(
                       scrip::identity::compute_condensed_ids_hash(
                           certificate_ids),
                       combined_amount, holder, service));
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace scrip::testing
