#include <warden/schema/encoding/scale/event_record.hpp>
#include <warden/schema/encoding/scale/transaction_event.hpp>

namespace warden::schema {

void encode(const event_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.height, encoder);
  encode(o.tx_index, encoder);
  encode(o.event, encoder);
}

void decode(event_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.height, decoder);
  decode(o.tx_index, decoder);
  decode(o.event, decoder);
}

}  // namespace warden::schema
