#include <conduit/schema/encoding/scale/expiration.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const expiration_never<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(expiration_never<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const expiration_at_height<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
}

void decode(expiration_at_height<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
}

void encode(const expiration_at_time<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.time, encoder);
}

void decode(expiration_at_time<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.time, decoder);
}

void encode(const duration_height<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.blocks, encoder);
}

void decode(duration_height<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.blocks, decoder);
}

void encode(const duration_time<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.seconds, encoder);
}

void decode(duration_time<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.seconds, decoder);
}

}  // namespace conduit::schema
