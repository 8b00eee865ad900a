#include <conduit/schema/encoding/scale/function.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const retry_indefinitely<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(retry_indefinitely<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const retry_amount<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.amount, encoder);
}

void decode(retry_amount<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.amount, decoder);
}

void encode(const retry_logic<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.times, encoder);
  encode(o.interval, encoder);
}

void decode(retry_logic<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.times, decoder);
  decode(o.interval, decoder);
}

void encode(const function_callback<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract_address, encoder);
  encode(o.callback_message, encoder);
}

void decode(function_callback<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract_address, decoder);
  decode(o.callback_message, decoder);
}

void encode(const atomic_function<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
  encode(o.message_details, encoder);
  encode(o.contract_address, encoder);
}

void decode(atomic_function<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
  decode(o.message_details, decoder);
  decode(o.contract_address, decoder);
}

void encode(const non_atomic_function<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
  encode(o.message_details, encoder);
  encode(o.contract_address, encoder);
  encode(o.retry_logic, encoder);
  encode(o.callback_confirmation, encoder);
}

void decode(non_atomic_function<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
  decode(o.message_details, decoder);
  decode(o.contract_address, decoder);
  decode(o.retry_logic, decoder);
  decode(o.callback_confirmation, decoder);
}

}  // namespace conduit::schema
