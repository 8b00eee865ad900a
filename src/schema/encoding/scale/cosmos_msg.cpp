#include <conduit/schema/encoding/scale/cosmos_msg.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const wasm_execute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract_address, encoder);
  encode(o.msg, encoder);
}

void decode(wasm_execute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract_address, decoder);
  decode(o.msg, decoder);
}

void encode(const wasm_migrate<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract_address, encoder);
  encode(o.code_id, encoder);
  encode(o.msg, encoder);
}

void decode(wasm_migrate<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract_address, decoder);
  decode(o.code_id, decoder);
  decode(o.msg, decoder);
}

}  // namespace conduit::schema
