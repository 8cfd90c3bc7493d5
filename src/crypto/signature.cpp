#include <scrip/blake3/hash.hpp>
#include <scrip/crypto/signature.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

namespace scrip::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

bignum_ptr make_bignum() {
  return bignum_ptr{BN_new(), BN_free};
}

bignum_ptr make_bignum(const uint8_t* data, const size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr), BN_free};
}

ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

std::optional<scrip::schema::public_key_t> encode_point(const EC_GROUP* group,
                                                        const EC_POINT* point,
                                                        BN_CTX* ctx) {
  auto out = scrip::schema::public_key_t{};
  auto written = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                    out.data(), out.size(), ctx);
  if (written != out.size()) {
    return std::nullopt;
  }
  return out;
}

/// Range checks of SEC 1 plus the low-s rule; malleable signatures are
/// rejected as malformed rather than normalized.
bool well_formed(const BIGNUM* r, const BIGNUM* s, const BIGNUM* order) {
  if (BN_is_zero(r) || BN_is_zero(s)) {
    return false;
  }
  if (BN_cmp(r, order) >= 0 || BN_cmp(s, order) >= 0) {
    return false;
  }
  auto half_order = make_bignum();
  if (!half_order || BN_rshift1(half_order.get(), order) != 1) {
    return false;
  }
  return BN_cmp(s, half_order.get()) <= 0;
}

std::optional<uint8_t> recovery_id(const uint8_t v) {
  if (v == 0 || v == 1) {
    return v;
  }
  if (v == 27 || v == 28) {
    return static_cast<uint8_t>(v - 27);
  }
  return std::nullopt;
}

/// Q = r^-1 (s R - e G) where R is the curve point with x = r and the parity
/// selected by the recovery id.
std::optional<scrip::schema::public_key_t> recover_point(
    const EC_GROUP* group,
    const scrip::schema::hash32_t& digest,
    const BIGNUM* r,
    const BIGNUM* s,
    const uint8_t recid,
    BN_CTX* ctx) {
  const auto* order = EC_GROUP_get0_order(group);
  auto field = make_bignum();
  if (!field || EC_GROUP_get_curve(group, field.get(), nullptr, nullptr, ctx) !=
                    1) {
    return std::nullopt;
  }
  if (BN_cmp(r, field.get()) >= 0) {
    return std::nullopt;
  }

  auto point_r = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group, point_r.get(), r, recid & 1,
                                          ctx) != 1) {
    return std::nullopt;
  }

  auto e = make_bignum(digest.data(), digest.size());
  auto zero = make_bignum();
  auto r_inverse = make_bignum();
  auto u1 = make_bignum();
  auto u2 = make_bignum();
  if (!e || !zero || !r_inverse || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_mod_inverse(r_inverse.get(), r, order, ctx) == nullptr) {
    return std::nullopt;
  }
  if (BN_mod_sub(u1.get(), zero.get(), e.get(), order, ctx) != 1 ||
      BN_mod_mul(u1.get(), u1.get(), r_inverse.get(), order, ctx) != 1 ||
      BN_mod_mul(u2.get(), s, r_inverse.get(), order, ctx) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!q || EC_POINT_mul(group, q.get(), u1.get(), point_r.get(), u2.get(),
                         ctx) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group, q.get()) == 1) {
    return std::nullopt;
  }
  return encode_point(group, q.get(), ctx);
}

evp_pkey_ptr make_signing_key(const scrip::schema::private_key_t& private_key,
                              const scrip::schema::public_key_t& public_key) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto secret = make_bignum(private_key.data(), private_key.size());
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!secret || !builder) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             secret.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return empty;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return empty;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return empty;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return empty;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now = static_cast<bool>(make_group());
  return available_now;
}

scrip::schema::hash32_t to_signed_message_hash(
    const scrip::schema::hash32_t& message_hash) {
  return scrip::blake3::hasher{}
      .update(kSignedMessagePrefix)
      .update(message_hash)
      .finalize();
}

std::optional<scrip::schema::public_key_t> recover_public_key(
    const scrip::schema::hash32_t& digest,
    const scrip::schema::recoverable_signature_t& signature) {
  auto recid = recovery_id(signature[64]);
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!recid || !group || !ctx || !r || !s) {
    return std::nullopt;
  }
  if (!well_formed(r.get(), s.get(), EC_GROUP_get0_order(group.get()))) {
    return std::nullopt;
  }
  return recover_point(group.get(), digest, r.get(), s.get(), *recid,
                       ctx.get());
}

std::optional<scrip::schema::address_t> recover_signer(
    const scrip::schema::hash32_t& message_hash,
    const scrip::schema::bytes_view_t& signature,
    scrip::schema::error_code& error) {
  if (signature.size() != scrip::schema::recoverable_signature_t{}.size()) {
    spdlog::debug("Rejecting signature of {} bytes", signature.size());
    error = scrip::schema::error_code::invalid_signature_format;
    return std::nullopt;
  }
  auto recid = recovery_id(signature[64]);
  if (!recid) {
    spdlog::debug("Rejecting signature with recovery byte {}", signature[64]);
    error = scrip::schema::error_code::invalid_signature_format;
    return std::nullopt;
  }

  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!group || !ctx || !r || !s) {
    spdlog::error("OpenSSL secp256k1 context allocation failed");
    error = scrip::schema::error_code::signature_recovery_failed;
    return std::nullopt;
  }
  if (!well_formed(r.get(), s.get(), EC_GROUP_get0_order(group.get()))) {
    error = scrip::schema::error_code::invalid_signature_format;
    return std::nullopt;
  }

  auto public_key =
      recover_point(group.get(), to_signed_message_hash(message_hash), r.get(),
                    s.get(), *recid, ctx.get());
  if (!public_key) {
    error = scrip::schema::error_code::signature_recovery_failed;
    return std::nullopt;
  }
  error = scrip::schema::error_code::ok;
  return address_from_public_key(*public_key);
}

scrip::schema::address_t address_from_public_key(
    const scrip::schema::public_key_t& public_key) {
  auto digest = scrip::blake3::hash(
      std::span<const uint8_t>{public_key.data() + 1, public_key.size() - 1});
  auto address = scrip::schema::address_t{};
  std::copy_n(digest.data() + (digest.size() - address.size()), address.size(),
              address.data());
  return address;
}

std::optional<scrip::schema::public_key_t> derive_public_key(
    const scrip::schema::private_key_t& private_key) {
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto secret = make_bignum(private_key.data(), private_key.size());
  if (!group || !ctx || !secret) {
    return std::nullopt;
  }
  if (BN_is_zero(secret.get()) ||
      BN_cmp(secret.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), secret.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  return encode_point(group.get(), point.get(), ctx.get());
}

std::optional<scrip::schema::address_t> derive_address(
    const scrip::schema::private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_public_key(*public_key);
}

std::optional<scrip::schema::recoverable_signature_t> sign(
    const scrip::schema::private_key_t& private_key,
    const scrip::schema::hash32_t& message_hash) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  auto pkey = make_signing_key(private_key, *public_key);
  if (!pkey) {
    spdlog::error("Failed to import secp256k1 signing key");
    return std::nullopt;
  }

  auto digest = to_signed_message_hash(message_hash);
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(),
                                                         nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(ecdsa_sig.get(), &r, &s);

  auto group = make_group();
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  auto half_order = make_bignum();
  if (!group || !low_s || !half_order) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  if (BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), order, s) != 1) {
    return std::nullopt;
  }

  auto signature = scrip::schema::recoverable_signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  for (uint8_t recid = 0; recid < 2; ++recid) {
    signature[64] = static_cast<uint8_t>(27 + recid);
    auto recovered = recover_public_key(digest, signature);
    if (recovered && *recovered == *public_key) {
      return signature;
    }
  }
  spdlog::error("Signature produced no matching recovery id");
  return std::nullopt;
}

std::optional<scrip::schema::private_key_t> generate_private_key() {
  auto group = make_group();
  if (!group) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  auto key = scrip::schema::private_key_t{};
  // Rejection sampling; the chance of a draw outside [1, n) is ~2^-128.
  for (int attempt = 0; attempt < 16; ++attempt) {
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
      return std::nullopt;
    }
    auto candidate = make_bignum(key.data(), key.size());
    if (candidate && !BN_is_zero(candidate.get()) &&
        BN_cmp(candidate.get(), order) < 0) {
      return key;
    }
  }
  return std::nullopt;
}

}  // namespace scrip::crypto
