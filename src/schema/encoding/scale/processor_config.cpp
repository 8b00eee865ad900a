#include <conduit/schema/encoding/scale/processor_config.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const processor_domain_main<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(processor_domain_main<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const processor_domain_polytone<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.polytone_proxy_address, encoder);
  encode(o.polytone_note_address, encoder);
  encode(o.timeout_seconds, encoder);
  encode(o.proxy_on_main_domain_state, encoder);
}

void decode(processor_domain_polytone<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.polytone_proxy_address, decoder);
  decode(o.polytone_note_address, decoder);
  decode(o.timeout_seconds, decoder);
  decode(o.proxy_on_main_domain_state, decoder);
}

void encode(const processor_domain_hyperlane<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.mailbox, encoder);
  encode(o.main_domain_id, encoder);
}

void decode(processor_domain_hyperlane<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.mailbox, decoder);
  decode(o.main_domain_id, decoder);
}

void encode(const processor_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authorization_contract, encoder);
  encode(o.processor_domain, encoder);
  encode(o.state, encoder);
}

void decode(processor_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authorization_contract, decoder);
  decode(o.processor_domain, decoder);
  decode(o.state, decoder);
}

}  // namespace conduit::schema
