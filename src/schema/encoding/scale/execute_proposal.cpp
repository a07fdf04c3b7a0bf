#include <warden/schema/encoding/scale/execute_proposal.hpp>

namespace warden::schema {

void encode(const execute_proposal<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.proposal_id, encoder);
}

void decode(execute_proposal<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.proposal_id, decoder);
}

}  // namespace warden::schema
