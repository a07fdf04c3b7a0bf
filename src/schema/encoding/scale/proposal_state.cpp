#include <warden/schema/encoding/scale/call.hpp>
#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/encoding/scale/proposal_state.hpp>

namespace warden::schema {

void encode(const proposal_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.proposer, encoder);
  encode(o.created_at, encoder);
  encode(o.expires_at, encoder);
  encode(o.status, encoder);
  encode(o.calls, encoder);
}

void decode(proposal_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.proposer, decoder);
  decode(o.created_at, decoder);
  decode(o.expires_at, decoder);
  decode(o.status, decoder);
  decode(o.calls, decoder);
}

}  // namespace warden::schema
