#include <conduit/schema/encoding/scale/hyperlane.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const hyperlane_dispatch<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.destination_domain, encoder);
  encode(o.recipient, encoder);
  encode(o.body, encoder);
}

void decode(hyperlane_dispatch<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.destination_domain, decoder);
  decode(o.recipient, decoder);
  decode(o.body, decoder);
}

void encode(const hyperlane_handle<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.origin, encoder);
  encode(o.sender, encoder);
  encode(o.body, encoder);
}

void decode(hyperlane_handle<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.origin, decoder);
  decode(o.sender, decoder);
  decode(o.body, decoder);
}

}  // namespace conduit::schema
