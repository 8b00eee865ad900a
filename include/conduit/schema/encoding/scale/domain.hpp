#pragma once
#include <conduit/schema/domain.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const domain_main<1>& o, ::scale::Encoder& encoder);
void decode(domain_main<1>& o, ::scale::Decoder& decoder);

void encode(const domain_external<1>& o, ::scale::Encoder& encoder);
void decode(domain_external<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_proxy_state<1>& o, ::scale::Encoder& encoder);
void decode(polytone_proxy_state<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_note<1>& o, ::scale::Encoder& encoder);
void decode(polytone_note<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_connectors<1>& o, ::scale::Encoder& encoder);
void decode(polytone_connectors<1>& o, ::scale::Decoder& decoder);

void encode(const evm_encoder<1>& o, ::scale::Encoder& encoder);
void decode(evm_encoder<1>& o, ::scale::Decoder& decoder);

void encode(const hyperlane_connector<1>& o, ::scale::Encoder& encoder);
void decode(hyperlane_connector<1>& o, ::scale::Decoder& decoder);

void encode(const cosmwasm_environment<1>& o, ::scale::Encoder& encoder);
void decode(cosmwasm_environment<1>& o, ::scale::Decoder& decoder);

void encode(const evm_environment<1>& o, ::scale::Encoder& encoder);
void decode(evm_environment<1>& o, ::scale::Decoder& decoder);

void encode(const external_domain<1>& o, ::scale::Encoder& encoder);
void decode(external_domain<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_note_info<1>& o, ::scale::Encoder& encoder);
void decode(polytone_note_info<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_connectors_info<1>& o, ::scale::Encoder& encoder);
void decode(polytone_connectors_info<1>& o, ::scale::Decoder& decoder);

void encode(const external_domain_info<1>& o, ::scale::Encoder& encoder);
void decode(external_domain_info<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
