#pragma once
#include <conduit/schema/authorization_msg.hpp>
#include <conduit/schema/encoding/scale/authorization.hpp>
#include <conduit/schema/encoding/scale/domain.hpp>
#include <conduit/schema/encoding/scale/execution_result.hpp>
#include <conduit/schema/encoding/scale/hyperlane.hpp>
#include <conduit/schema/encoding/scale/polytone.hpp>
#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const registry_instantiate<1>& o, ::scale::Encoder& encoder);
void decode(registry_instantiate<1>& o, ::scale::Decoder& decoder);

void encode(const add_sub_owner<1>& o, ::scale::Encoder& encoder);
void decode(add_sub_owner<1>& o, ::scale::Decoder& decoder);

void encode(const remove_sub_owner<1>& o, ::scale::Encoder& encoder);
void decode(remove_sub_owner<1>& o, ::scale::Decoder& decoder);

void encode(const add_external_domains<1>& o, ::scale::Encoder& encoder);
void decode(add_external_domains<1>& o, ::scale::Decoder& decoder);

void encode(const create_authorizations<1>& o, ::scale::Encoder& encoder);
void decode(create_authorizations<1>& o, ::scale::Decoder& decoder);

void encode(const modify_authorization<1>& o, ::scale::Encoder& encoder);
void decode(modify_authorization<1>& o, ::scale::Decoder& decoder);

void encode(const disable_authorization<1>& o, ::scale::Encoder& encoder);
void decode(disable_authorization<1>& o, ::scale::Decoder& decoder);

void encode(const enable_authorization<1>& o, ::scale::Encoder& encoder);
void decode(enable_authorization<1>& o, ::scale::Decoder& decoder);

void encode(const mint_authorizations<1>& o, ::scale::Encoder& encoder);
void decode(mint_authorizations<1>& o, ::scale::Decoder& decoder);

void encode(const remove_msgs<1>& o, ::scale::Encoder& encoder);
void decode(remove_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const add_msgs<1>& o, ::scale::Encoder& encoder);
void decode(add_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const pause_processor<1>& o, ::scale::Encoder& encoder);
void decode(pause_processor<1>& o, ::scale::Decoder& decoder);

void encode(const resume_processor<1>& o, ::scale::Encoder& encoder);
void decode(resume_processor<1>& o, ::scale::Decoder& decoder);

void encode(const send_msgs<1>& o, ::scale::Encoder& encoder);
void decode(send_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const processor_callback<1>& o, ::scale::Encoder& encoder);
void decode(processor_callback<1>& o, ::scale::Decoder& decoder);

void encode(const retry_msgs<1>& o, ::scale::Encoder& encoder);
void decode(retry_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const retry_bridge_creation<1>& o, ::scale::Encoder& encoder);
void decode(retry_bridge_creation<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
