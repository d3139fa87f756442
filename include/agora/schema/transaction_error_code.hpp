#pragma once

#include <cstdint>
#include <string_view>

namespace agora::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_signature_type = 5,
  signature_verification_failed = 6,
  unauthorized = 10,
  duplicate_id = 11,
  insufficient_fee = 12,
  unknown_dao = 13,
  duplicate_proposal = 14,
  invalid_time_window = 15,
  proposal_not_found = 16,
  not_eligible = 17,
  voting_not_active = 18,
  insufficient_tokens = 19,
  voting_still_active = 20,
  already_finalized = 21,
  malformed_payload = 22,
  dispatch_failed = 23,
  duplicate_message = 24,
  untrusted_relayer = 25,
  weight_overflow = 26,
};

constexpr std::string_view to_string(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::invalid_chain_id:
      return "invalid chain id";
    case transaction_error_code::invalid_nonce:
      return "invalid nonce";
    case transaction_error_code::invalid_signature_type:
      return "invalid signature type";
    case transaction_error_code::signature_verification_failed:
      return "signature verification failed";
    case transaction_error_code::unauthorized:
      return "unauthorized";
    case transaction_error_code::duplicate_id:
      return "dao id already registered";
    case transaction_error_code::insufficient_fee:
      return "insufficient fee";
    case transaction_error_code::unknown_dao:
      return "unknown dao";
    case transaction_error_code::duplicate_proposal:
      return "proposal already exists";
    case transaction_error_code::invalid_time_window:
      return "end must be after start";
    case transaction_error_code::proposal_not_found:
      return "proposal not found";
    case transaction_error_code::not_eligible:
      return "voter not whitelisted";
    case transaction_error_code::voting_not_active:
      return "voting not active";
    case transaction_error_code::insufficient_tokens:
      return "insufficient governance tokens";
    case transaction_error_code::voting_still_active:
      return "voting still active";
    case transaction_error_code::already_finalized:
      return "proposal already finalized";
    case transaction_error_code::malformed_payload:
      return "malformed payload";
    case transaction_error_code::dispatch_failed:
      return "dispatch failed";
    case transaction_error_code::duplicate_message:
      return "message already applied";
    case transaction_error_code::untrusted_relayer:
      return "untrusted relayer";
    case transaction_error_code::weight_overflow:
      return "weight overflow";
  }
  return "unknown";
}

}  // namespace agora::schema
