#pragma once

#include <agora/schema/primitives.hpp>
#include <openssl/evp.h>

#include <memory>
#include <optional>

namespace agora::testing {

/// Freshly generated ed25519 key pair backed by OpenSSL.
class ed25519_key final {
 public:
  static std::optional<ed25519_key> generate() {
    auto ctx = std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    if (!ctx || EVP_PKEY_keygen_init(ctx.get()) != 1) {
      return std::nullopt;
    }
    auto* raw = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_keygen(ctx.get(), &raw) != 1) {
      return std::nullopt;
    }
    auto key = ed25519_key{raw};
    auto size = key.signer_.public_key.size();
    if (EVP_PKEY_get_raw_public_key(raw, key.signer_.public_key.data(),
                                    &size) != 1 ||
        size != key.signer_.public_key.size()) {
      return std::nullopt;
    }
    return key;
  }

  const agora::schema::ed25519_signer_id& signer() const { return signer_; }

  std::optional<agora::schema::ed25519_signature_t> sign(
      const agora::schema::bytes_view_t& message) const {
    auto ctx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>{
        EVP_MD_CTX_new(), EVP_MD_CTX_free};
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr,
                                   pkey_.get()) != 1) {
      return std::nullopt;
    }
    auto signature = agora::schema::ed25519_signature_t{};
    auto size = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &size, message.data(),
                       message.size()) != 1 ||
        size != signature.size()) {
      return std::nullopt;
    }
    return signature;
  }

 private:
  explicit ed25519_key(EVP_PKEY* pkey) : pkey_{pkey, EVP_PKEY_free} {}

  std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> pkey_;
  agora::schema::ed25519_signer_id signer_{};
};

}  // namespace agora::testing
