#include <warden/schema/encoding/scale/add_signer.hpp>
#include <warden/schema/encoding/scale/cancel_proposal.hpp>
#include <warden/schema/encoding/scale/cancel_vote_for.hpp>
#include <warden/schema/encoding/scale/execute_proposal.hpp>
#include <warden/schema/encoding/scale/propose.hpp>
#include <warden/schema/encoding/scale/remove_signer.hpp>
#include <warden/schema/encoding/scale/transaction.hpp>
#include <warden/schema/encoding/scale/vote_for.hpp>
#include <warden/schema/encoding/scale/vote_on_behalf_of.hpp>

namespace warden::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.sequence, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.sequence, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

}  // namespace warden::schema
