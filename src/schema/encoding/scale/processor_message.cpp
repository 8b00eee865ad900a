#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const cosmwasm_execute_msg<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msg, encoder);
}

void decode(cosmwasm_execute_msg<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msg, decoder);
}

void encode(const cosmwasm_migrate_msg<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.code_id, encoder);
  encode(o.msg, encoder);
}

void decode(cosmwasm_migrate_msg<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.code_id, decoder);
  decode(o.msg, decoder);
}

void encode(const evm_call_msg<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msg, encoder);
}

void decode(evm_call_msg<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msg, decoder);
}

void encode(const evm_raw_call_msg<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msg, encoder);
}

void decode(evm_raw_call_msg<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msg, decoder);
}

}  // namespace conduit::schema
