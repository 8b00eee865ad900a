#include <conduit/schema/encoding/scale/message_details.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const must_be_included<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
}

void decode(must_be_included<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
}

void encode(const cannot_be_included<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
}

void decode(cannot_be_included<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
}

void encode(const must_be_value<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.value, encoder);
}

void decode(must_be_value<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.value, decoder);
}

void encode(const message_definition<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.params_restrictions, encoder);
}

void decode(message_definition<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.params_restrictions, decoder);
}

void encode(const message_details<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.message_type, encoder);
  encode(o.message, encoder);
}

void decode(message_details<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.message_type, decoder);
  decode(o.message, decoder);
}

}  // namespace conduit::schema
