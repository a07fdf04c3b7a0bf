#include <warden/schema/encoding/scale/primitives.hpp>
#include <warden/schema/encoding/scale/vote_on_behalf_of.hpp>

namespace warden::schema {

void encode(const vote_on_behalf_of<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
  encode(o.voter, encoder);
  encode(o.support, encoder);
  encode(o.signature, encoder);
}

void decode(vote_on_behalf_of<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
  decode(o.voter, decoder);
  decode(o.support, decoder);
  decode(o.signature, decoder);
}

}  // namespace warden::schema
