#pragma once
#include <conduit/schema/processor_message.hpp>
#include <conduit/schema/encoding/scale/message_details.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const cosmwasm_execute_msg<1>& o, ::scale::Encoder& encoder);
void decode(cosmwasm_execute_msg<1>& o, ::scale::Decoder& decoder);

void encode(const cosmwasm_migrate_msg<1>& o, ::scale::Encoder& encoder);
void decode(cosmwasm_migrate_msg<1>& o, ::scale::Decoder& decoder);

void encode(const evm_call_msg<1>& o, ::scale::Encoder& encoder);
void decode(evm_call_msg<1>& o, ::scale::Decoder& decoder);

void encode(const evm_raw_call_msg<1>& o, ::scale::Encoder& encoder);
void decode(evm_raw_call_msg<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
