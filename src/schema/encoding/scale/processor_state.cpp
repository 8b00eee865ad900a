#include <conduit/schema/encoding/scale/processor_state.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const pending_operation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.kind, encoder);
  encode(o.function_index, encoder);
}

void decode(pending_operation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.kind, decoder);
  decode(o.function_index, decoder);
}

void encode(const pending_confirmation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.address, encoder);
  encode(o.callback_msg, encoder);
  encode(o.function_index, encoder);
}

void decode(pending_confirmation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.address, decoder);
  decode(o.callback_msg, decoder);
  decode(o.function_index, decoder);
}

void encode(const bridge_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.delivery, encoder);
  encode(o.error, encoder);
}

void decode(bridge_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.delivery, decoder);
  decode(o.error, decoder);
}

void encode(const pending_bridge_callback<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_result, encoder);
  encode(o.bridge, encoder);
}

void decode(pending_bridge_callback<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_result, decoder);
  decode(o.bridge, decoder);
}

}  // namespace conduit::schema
