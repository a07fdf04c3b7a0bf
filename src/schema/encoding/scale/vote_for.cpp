#include <warden/schema/encoding/scale/vote_for.hpp>

namespace warden::schema {

void encode(const vote_for<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
}

void decode(vote_for<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
}

}  // namespace warden::schema
