#pragma once

#include <scrip/schema/error_code.hpp>
#include <scrip/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace scrip::crypto {

/// Prefix bound into every signed digest so that a redemption signature can
/// never double as a signature over a raw 32-byte hash.
inline constexpr std::string_view kSignedMessagePrefix{
    "\x19Scrip Signed Message:\n32"};

/// True when the OpenSSL build exposes the secp256k1 curve.
bool available();

/// BLAKE3(prefix || message_hash); the digest actually signed and recovered.
scrip::schema::hash32_t to_signed_message_hash(
    const scrip::schema::hash32_t& message_hash);

/// Recover the address that signed `message_hash` (before prefixing).
///
/// On failure returns std::nullopt and sets `error` to
/// `invalid_signature_format` (length, recovery byte, r/s range, high s) or
/// `signature_recovery_failed` (no curve point / key for the signature).
std::optional<scrip::schema::address_t> recover_signer(
    const scrip::schema::hash32_t& message_hash,
    const scrip::schema::bytes_view_t& signature,
    scrip::schema::error_code& error);

/// Raw public key recovery over an already-prefixed digest.
std::optional<scrip::schema::public_key_t> recover_public_key(
    const scrip::schema::hash32_t& digest,
    const scrip::schema::recoverable_signature_t& signature);

/// Last 20 bytes of BLAKE3(X || Y).
scrip::schema::address_t address_from_public_key(
    const scrip::schema::public_key_t& public_key);

std::optional<scrip::schema::public_key_t> derive_public_key(
    const scrip::schema::private_key_t& private_key);

std::optional<scrip::schema::address_t> derive_address(
    const scrip::schema::private_key_t& private_key);

/// Sign `message_hash` (prefix applied internally). The result is low-s with
/// v = 27 + recovery id.
std::optional<scrip::schema::recoverable_signature_t> sign(
    const scrip::schema::private_key_t& private_key,
    const scrip::schema::hash32_t& message_hash);

std::optional<scrip::schema::private_key_t> generate_private_key();

}  // namespace scrip::crypto
