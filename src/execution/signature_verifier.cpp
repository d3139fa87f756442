#include <agora/execution/signature_verifier.hpp>

#include <variant>

namespace agora::execution {

agora::schema::bytes_t signing_payload(
    agora::schema::encoding::encoder<
        agora::schema::encoding::scale_encoder_tag>& encoder,
    agora::schema::transaction_t tx) {
  std::visit([](auto& signature) { signature.fill(0); }, tx.signature);
  return encoder.encode(tx);
}

}  // namespace agora::execution
