#include <conduit/schema/encoding/scale/callback_info.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const processor_callback_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.label, encoder);
  encode(o.initiator, encoder);
  encode(o.domain, encoder);
  encode(o.processor_callback_address, encoder);
  encode(o.messages, encoder);
  encode(o.ttl, encoder);
  encode(o.execution_result, encoder);
  encode(o.bridge, encoder);
  encode(o.dispatch_payload, encoder);
  encode(o.escrowed_mint, encoder);
  encode(o.holds_concurrency_slot, encoder);
  encode(o.created_at_height, encoder);
  encode(o.created_at_time, encoder);
}

void decode(processor_callback_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.label, decoder);
  decode(o.initiator, decoder);
  decode(o.domain, decoder);
  decode(o.processor_callback_address, decoder);
  decode(o.messages, decoder);
  decode(o.ttl, decoder);
  decode(o.execution_result, decoder);
  decode(o.bridge, decoder);
  decode(o.dispatch_payload, decoder);
  decode(o.escrowed_mint, decoder);
  decode(o.holds_concurrency_slot, decoder);
  decode(o.created_at_height, decoder);
  decode(o.created_at_time, decoder);
}

}  // namespace conduit::schema
