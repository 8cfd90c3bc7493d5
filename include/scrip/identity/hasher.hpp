#pragma once

#include <scrip/schema/primitives.hpp>
#include <span>
#include <string_view>
#include <vector>

// Identity derivations shared by the engine and by off-chain signers.
//
// All digests are BLAKE3-256 over the material below, integers little-endian:
//
//   certificate id:
//     "SCRIP|CERTIFICATE_ID|V1" | amount (32) | service (20)
//     | u32 delegate count | delegate (20) * n | u32 metadata size | metadata
//   redemption hash:
//     "SCRIP|REDEMPTION|V1" | certificate id (32) | service (20) | holder (20)
//   condensed ids hash:
//     "SCRIP|CONDENSED_IDS|V1" | certificate id (32) * n
//   condensed redemption hash:
//     "SCRIP|CONDENSED_REDEMPTION|V1" | condensed ids hash (32)
//     | combined amount (32) | holder (20) | service (20)
namespace scrip::identity {

inline constexpr std::string_view kCertificateIdTag{"SCRIP|CERTIFICATE_ID|V1"};
inline constexpr std::string_view kRedemptionTag{"SCRIP|REDEMPTION|V1"};
inline constexpr std::string_view kCondensedIdsTag{"SCRIP|CONDENSED_IDS|V1"};
inline constexpr std::string_view kCondensedRedemptionTag{
    "SCRIP|CONDENSED_REDEMPTION|V1"};

scrip::schema::certificate_id_t compute_certificate_id(
    const scrip::schema::amount_t& amount,
    const scrip::schema::address_t& service,
    const std::vector<scrip::schema::address_t>& delegates,
    std::string_view metadata);

scrip::schema::hash32_t compute_redemption_hash(
    const scrip::schema::certificate_id_t& certificate_id,
    const scrip::schema::address_t& service,
    const scrip::schema::address_t& holder);

/// Order-sensitive digest of a certificate id list.
scrip::schema::hash32_t compute_condensed_ids_hash(
    std::span<const scrip::schema::certificate_id_t> certificate_ids);

scrip::schema::hash32_t compute_condensed_redemption_hash(
    const scrip::schema::hash32_t& condensed_ids_hash,
    const scrip::schema::amount_t& combined_amount,
    const scrip::schema::address_t& holder,
    const scrip::schema::address_t& service);

}  // namespace scrip::identity
