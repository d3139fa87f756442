#pragma once

#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/transaction.hpp>
#include <functional>

namespace agora::execution {

using signature_verifier_t =
    std::function<bool(const agora::schema::bytes_view_t& message,
                       const agora::schema::signer_id_t& signer,
                       const agora::schema::signature_t& signature)>;

/// Bytes a signer commits to: the transaction encoding with the signature
/// bytes zeroed.  The signature variant itself is kept.
agora::schema::bytes_t signing_payload(
    agora::schema::encoding::encoder<
        agora::schema::encoding::scale_encoder_tag>& encoder,
    agora::schema::transaction_t tx);

}  // namespace agora::execution
