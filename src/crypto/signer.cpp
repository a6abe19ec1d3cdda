#include <tollbooth/crypto/signer.hpp>
#include <tollbooth/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <array>
#include <memory>
#include <utility>

namespace tollbooth::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using params_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

std::shared_ptr<EVP_PKEY> share(EVP_PKEY* key) {
  return std::shared_ptr<EVP_PKEY>{key, EVP_PKEY_free};
}

std::optional<tollbooth::schema::bytes_t> secp256k1_public_key(
    const BIGNUM* private_key) {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), private_key, nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  auto out = tollbooth::schema::bytes_t(65);
  if (EC_POINT_point2oct(group.get(), point.get(),
                         POINT_CONVERSION_UNCOMPRESSED, out.data(), out.size(),
                         ctx.get()) != out.size()) {
    return std::nullopt;
  }
  return out;
}

}  // namespace

ed25519_signer::ed25519_signer(std::shared_ptr<evp_pkey_st> key,
                               tollbooth::schema::bytes_t public_key)
    : key_{std::move(key)}, public_key_{std::move(public_key)} {}

std::optional<ed25519_signer> ed25519_signer::from_seed(
    const tollbooth::schema::bytes_view_t& seed) {
  if (seed.size() != 32) {
    return std::nullopt;
  }
  auto key = share(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                                seed.data(), seed.size()));
  if (!key) {
    return std::nullopt;
  }
  auto public_key = tollbooth::schema::bytes_t(32);
  auto public_key_size = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(),
                                  &public_key_size) != 1 ||
      public_key_size != 32) {
    return std::nullopt;
  }
  return ed25519_signer{std::move(key), std::move(public_key)};
}

std::optional<tollbooth::schema::bytes_t> ed25519_signer::sign(
    const tollbooth::schema::bytes_view_t& message) const {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key_.get()) !=
          1) {
    return std::nullopt;
  }
  auto signature = tollbooth::schema::bytes_t(64);
  auto signature_size = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_size,
                     message.data(), message.size()) != 1 ||
      signature_size != 64) {
    return std::nullopt;
  }
  return signature;
}

secp256k1_signer::secp256k1_signer(std::shared_ptr<evp_pkey_st> key,
                                   tollbooth::schema::bytes_t public_key)
    : key_{std::move(key)}, public_key_{std::move(public_key)} {}

std::optional<secp256k1_signer> secp256k1_signer::from_private_key(
    const tollbooth::schema::bytes_view_t& private_key) {
  if (private_key.size() != 32) {
    return std::nullopt;
  }
  auto priv = bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_free};
  if (!priv || BN_is_zero(priv.get())) {
    return std::nullopt;
  }
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group || BN_cmp(priv.get(), EC_GROUP_get0_order(group.get())) >= 0) {
    return std::nullopt;
  }
  auto public_key = secp256k1_public_key(priv.get());
  if (!public_key) {
    return std::nullopt;
  }

  auto bld = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!bld ||
      OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             priv.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key->data(),
                                       public_key->size()) != 1) {
    return std::nullopt;
  }
  auto params = params_ptr{OSSL_PARAM_BLD_to_param(bld.get()), OSSL_PARAM_free};
  if (!params) {
    return std::nullopt;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return std::nullopt;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return std::nullopt;
  }
  return secp256k1_signer{share(raw_pkey), std::move(*public_key)};
}

std::optional<tollbooth::schema::bytes_t> secp256k1_signer::sign(
    const tollbooth::schema::hash32_t& digest) const {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new(key_.get(), nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_sign_init(ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = std::size_t{0};
  if (EVP_PKEY_sign(ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = tollbooth::schema::bytes_t(der_size);
  if (EVP_PKEY_sign(ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = der.data();
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }
  const auto* r = ECDSA_SIG_get0_r(sig.get());
  const auto* s = ECDSA_SIG_get0_s(sig.get());

  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto half_order = bignum_ptr{BN_new(), BN_free};
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!group || !half_order || !low_s ||
      BN_rshift1(half_order.get(), EC_GROUP_get0_order(group.get())) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), EC_GROUP_get0_order(group.get()), s) != 1) {
    return std::nullopt;
  }

  auto out = tollbooth::schema::bytes_t(65);
  if (BN_bn2binpad(r, out.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), out.data() + 32, 32) != 32) {
    return std::nullopt;
  }

  for (auto v = uint8_t{0}; v < 2; ++v) {
    out[64] = v;
    auto recovered = recover_secp256k1(digest, out);
    if (recovered && *recovered == public_key_) {
      return out;
    }
  }
  return std::nullopt;
}

}  // namespace tollbooth::crypto
