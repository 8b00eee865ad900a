#include <conduit/schema/encoding/scale/domain.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const domain_main<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(domain_main<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const domain_external<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
}

void decode(domain_external<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
}

void encode(const polytone_proxy_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.status, encoder);
  encode(o.error, encoder);
}

void decode(polytone_proxy_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.status, decoder);
  decode(o.error, decoder);
}

void encode(const polytone_note<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.timeout_seconds, encoder);
  encode(o.state, encoder);
}

void decode(polytone_note<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.timeout_seconds, decoder);
  decode(o.state, decoder);
}

void encode(const polytone_connectors<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.note, encoder);
  encode(o.proxy, encoder);
}

void decode(polytone_connectors<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.note, decoder);
  decode(o.proxy, decoder);
}

void encode(const evm_encoder<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.broker_address, encoder);
  encode(o.encoder_version, encoder);
}

void decode(evm_encoder<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.broker_address, decoder);
  decode(o.encoder_version, decoder);
}

void encode(const hyperlane_connector<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.mailbox, encoder);
  encode(o.domain_id, encoder);
}

void decode(hyperlane_connector<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.mailbox, decoder);
  decode(o.domain_id, decoder);
}

void encode(const cosmwasm_environment<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.polytone, encoder);
}

void decode(cosmwasm_environment<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.polytone, decoder);
}

void encode(const evm_environment<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.encoder, encoder);
  encode(o.hyperlane, encoder);
}

void decode(evm_environment<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.encoder, decoder);
  decode(o.hyperlane, decoder);
}

void encode(const external_domain<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.execution_environment, encoder);
  encode(o.processor, encoder);
}

void decode(external_domain<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.execution_environment, decoder);
  decode(o.processor, decoder);
}

void encode(const polytone_note_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.timeout_seconds, encoder);
}

void decode(polytone_note_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.timeout_seconds, decoder);
}

void encode(const polytone_connectors_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.note, encoder);
  encode(o.proxy, encoder);
}

void decode(polytone_connectors_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.note, decoder);
  decode(o.proxy, decoder);
}

void encode(const external_domain_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.execution_environment, encoder);
  encode(o.processor, encoder);
}

void decode(external_domain_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.execution_environment, decoder);
  decode(o.processor, decoder);
}

}  // namespace conduit::schema
