#include <tollbooth/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace tollbooth::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

bool openssl_has_ed25519() {
  auto ctx = evp_pkey_ctx_ptr{EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr),
                              EVP_PKEY_CTX_free};
  if (!ctx) {
    return false;
  }
  return true;
}

bool openssl_has_secp256k1() {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  if (!group) {
    return false;
  }
  return true;
}

const EVP_MD* keccak_md() {
  static const auto md =
      evp_md_ptr{EVP_MD_fetch(nullptr, "KECCAK-256", nullptr), EVP_MD_free};
  return md.get();
}

bignum_ptr make_bignum(const uint8_t* data, const std::size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr), BN_free};
}

}  // namespace

bool available() {
  static const auto available_now =
      openssl_has_ed25519() && openssl_has_secp256k1();
  return available_now;
}

bool keccak_available() {
  return keccak_md() != nullptr;
}

std::optional<tollbooth::schema::hash32_t> keccak256(
    const tollbooth::schema::bytes_view_t& data) {
  const auto* md = keccak_md();
  if (md == nullptr) {
    return std::nullopt;
  }
  auto out = tollbooth::schema::hash32_t{};
  auto out_size = 0u;
  if (EVP_Digest(data.data(), data.size(), out.data(), &out_size, md,
                 nullptr) != 1 ||
      out_size != out.size()) {
    return std::nullopt;
  }
  return out;
}

bool verify_ed25519(const tollbooth::schema::bytes_view_t& message,
                    const tollbooth::schema::bytes_view_t& public_key,
                    const tollbooth::schema::bytes_view_t& signature) {
  if (public_key.size() != 32 || signature.size() != 64) {
    return false;
  }
  auto pkey = evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(),
                                  public_key.size()),
      EVP_PKEY_free};
  if (!pkey) {
    return false;
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) ==
      1) {
    ok = EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
  }
  return ok;
}

std::optional<tollbooth::schema::bytes_t> recover_secp256k1(
    const tollbooth::schema::hash32_t& digest,
    const tollbooth::schema::bytes_view_t& signature) {
  if (signature.size() != 65) {
    return std::nullopt;
  }
  auto v = signature[64];
  if (v >= 27) {
    v = static_cast<uint8_t>(v - 27);
  }
  // Recovery ids 2 and 3 (r >= n) never occur in practice.
  if (v > 1) {
    return std::nullopt;
  }

  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  auto e = make_bignum(digest.data(), digest.size());
  auto half_order = bignum_ptr{BN_new(), BN_free};
  if (!r || !s || !e || !half_order ||
      BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), half_order.get()) > 0) {
    return std::nullopt;
  }

  // R = point with x = r and the parity named by v.
  auto compressed = std::array<uint8_t, 33>{};
  compressed[0] = static_cast<uint8_t>(0x02 | v);
  std::copy_n(signature.data(), 32, compressed.data() + 1);
  auto big_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!big_r || EC_POINT_oct2point(group.get(), big_r.get(), compressed.data(),
                                   compressed.size(), ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 * (s * R - e * G) = (-e * r^-1) * G + (s * r^-1) * R
  auto r_inverse = bignum_ptr{BN_new(), BN_free};
  auto e_mod = bignum_ptr{BN_new(), BN_free};
  auto neg_e = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!r_inverse || !e_mod || !neg_e || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_mod_inverse(r_inverse.get(), r.get(), order, ctx.get()) == nullptr ||
      BN_nnmod(e_mod.get(), e.get(), order, ctx.get()) != 1 ||
      BN_mod_sub(neg_e.get(), order, e_mod.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), neg_e.get(), r_inverse.get(), order, ctx.get()) !=
          1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(), u2.get(),
                         ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }

  auto out = tollbooth::schema::bytes_t(65);
  if (EC_POINT_point2oct(group.get(), q.get(), POINT_CONVERSION_UNCOMPRESSED,
                         out.data(), out.size(), ctx.get()) != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<tollbooth::schema::address_t> evm_address(
    const tollbooth::schema::bytes_view_t& uncompressed_public_key) {
  if (uncompressed_public_key.size() != 65 ||
      uncompressed_public_key[0] != 0x04) {
    return std::nullopt;
  }
  auto hash = keccak256(uncompressed_public_key.subspan(1));
  if (!hash) {
    return std::nullopt;
  }
  return tollbooth::schema::address_t{std::begin(*hash) + 12, std::end(*hash)};
}

std::optional<tollbooth::schema::address_t> recover_evm_address(
    const tollbooth::schema::hash32_t& digest,
    const tollbooth::schema::bytes_view_t& signature) {
  auto public_key = recover_secp256k1(digest, signature);
  if (!public_key) {
    return std::nullopt;
  }
  return evm_address(*public_key);
}

}  // namespace tollbooth::crypto
