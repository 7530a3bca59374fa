#include <timeshare/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace timeshare::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

bool digest_verify(EVP_PKEY* pkey,
                   const EVP_MD* digest,
                   const timeshare::schema::bytes_view_t& signature,
                   const timeshare::schema::bytes_view_t& message) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, pkey) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(),
                          message.data(), message.size()) == 1;
}

evp_pkey_ptr make_ed25519_key(
    const timeshare::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(
    const timeshare::schema::secp256k1_signer_id& signer) {
  auto no_key = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return no_key;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return no_key;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

// Accepts [v || r || s] and [r || s || v]; v is a recovery id in 0..3 or
// the legacy 27..34 range. Returns every compact [r || s] reading whose
// recovery byte is plausible, leading layout first.
std::vector<std::array<uint8_t, 64>> compact_secp256k1_signatures(
    const timeshare::schema::secp256k1_signature_t& signature) {
  auto is_recovery_id = [](const uint8_t v) {
    return v <= 3 || (v >= 27 && v <= 34);
  };
  auto out = std::vector<std::array<uint8_t, 64>>{};
  if (is_recovery_id(signature.front())) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.data() + 1, compact.size(), compact.data());
  }
  if (is_recovery_id(signature.back())) {
    auto& compact = out.emplace_back();
    std::copy_n(signature.data(), compact.size(), compact.data());
  }
  return out;
}

std::optional<std::vector<uint8_t>> der_encode(
    const std::array<uint8_t, 64>& compact) {
  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  auto r = bignum_ptr{BN_bin2bn(compact.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(compact.data() + 32, 32, nullptr), BN_free};
  if (!r || !s ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return std::nullopt;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr) != der_len) {
    return std::nullopt;
  }
  return der;
}

bool verify_ed25519(const timeshare::schema::bytes_view_t& message,
                    const timeshare::schema::ed25519_signer_id& signer,
                    const timeshare::schema::ed25519_signature_t& signature) {
  auto pkey = make_ed25519_key(signer);
  if (!pkey) {
    return false;
  }
  // ed25519 hashes internally, so no digest is passed.
  return digest_verify(pkey.get(), nullptr, signature, message);
}

bool verify_secp256k1(
    const timeshare::schema::bytes_view_t& message,
    const timeshare::schema::secp256k1_signer_id& signer,
    const timeshare::schema::secp256k1_signature_t& signature) {
  auto pkey = make_secp256k1_key(signer);
  if (!pkey) {
    return false;
  }
  return std::ranges::any_of(
      compact_secp256k1_signatures(signature),
      [&](const std::array<uint8_t, 64>& compact) {
        auto der = der_encode(compact);
        return der && digest_verify(pkey.get(), EVP_sha256(), *der, message);
      });
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const timeshare::schema::bytes_view_t& message,
                      const timeshare::schema::signer_id_t& signer,
                      const timeshare::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const timeshare::schema::ed25519_signer_id& value) {
            const auto* ed25519 =
                std::get_if<timeshare::schema::ed25519_signature_t>(
                    &signature);
            return ed25519 != nullptr &&
                   verify_ed25519(message, value, *ed25519);
          },
          [&](const timeshare::schema::secp256k1_signer_id& value) {
            const auto* secp256k1 =
                std::get_if<timeshare::schema::secp256k1_signature_t>(
                    &signature);
            return secp256k1 != nullptr &&
                   verify_secp256k1(message, value, *secp256k1);
          },
          [](const timeshare::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace timeshare::crypto
