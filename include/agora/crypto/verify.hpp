#pragma once

#include <agora/schema/primitives.hpp>

namespace agora::crypto {

/// True when the linked OpenSSL exposes both ed25519 and secp256k1.
bool available();

bool verify_signature(const agora::schema::bytes_view_t& message,
                      const agora::schema::signer_id_t& signer,
                      const agora::schema::signature_t& signature);

/// Governance address of a signer: the named identity itself, or the BLAKE3
/// digest of the public key bytes.
agora::schema::address_t address_of(const agora::schema::signer_id_t& signer);

}  // namespace agora::crypto
