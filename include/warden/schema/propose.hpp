#pragma once
#include <warden/schema/call.hpp>
#include <warden/schema/primitives.hpp>
#include <vector>

// Schema type: propose.
// Governance workflow: submit a batch; the proposer's yes vote is cast in the
// same transaction.
namespace warden::schema {

template <uint16_t Version>
struct propose;

template <>
struct propose<1> final {
  uint16_t version{1};
  std::vector<call_t> calls;
  timestamp_milliseconds_t expires_at{};
};

using propose_t = propose<1>;

}  // namespace warden::schema
