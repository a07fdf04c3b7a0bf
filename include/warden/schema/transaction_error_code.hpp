#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace warden::schema {

/// Stable failure codes. The decade of a code names its category.
enum class transaction_error_code : uint32_t {
  // admission
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_sequence = 4,
  signature_verification_failed = 5,
  wallet_not_initialized = 6,
  wallet_already_initialized = 7,
  // authorization
  not_a_signer = 10,
  not_governance_path = 11,
  not_a_canceller = 12,
  // state
  proposal_not_proposed = 20,
  proposal_expired = 21,
  already_voted = 22,
  vote_not_cast = 23,
  insufficient_votes = 24,
  // validation
  empty_batch = 30,
  expiration_not_in_future = 31,
  null_signer = 32,
  duplicate_signer = 33,
  signer_limit_reached = 34,
  signer_missing = 35,
  last_signer = 36,
  invalid_genesis = 37,
  // signature
  invalid_vote_signature = 40,
  // execution
  call_failed = 50,
  call_target_missing = 51,
  invalid_governance_call = 52,
  call_depth_exceeded = 53,
};

enum class error_category_t : uint8_t {
  admission,
  authorization,
  state,
  validation,
  signature,
  execution
};

error_category_t category_of(transaction_error_code code);

/// `warden.<category>`
std::string_view codespace_of(transaction_error_code code);

/// Component failure: the code plus a human readable log line.
struct transaction_error_t final {
  transaction_error_code code{};
  std::string log;
};

}  // namespace warden::schema
