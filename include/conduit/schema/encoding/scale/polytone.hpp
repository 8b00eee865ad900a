#pragma once
#include <conduit/schema/polytone.hpp>
#include <conduit/schema/encoding/scale/cosmos_msg.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const polytone_callback_request<1>& o, ::scale::Encoder& encoder);
void decode(polytone_callback_request<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_execute<1>& o, ::scale::Encoder& encoder);
void decode(polytone_execute<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_execute_success<1>& o, ::scale::Encoder& encoder);
void decode(polytone_execute_success<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_execute_error<1>& o, ::scale::Encoder& encoder);
void decode(polytone_execute_error<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_callback_message<1>& o, ::scale::Encoder& encoder);
void decode(polytone_callback_message<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_tag_create_proxy<1>& o, ::scale::Encoder& encoder);
void decode(polytone_tag_create_proxy<1>& o, ::scale::Decoder& decoder);

void encode(const polytone_tag_execution_id<1>& o, ::scale::Encoder& encoder);
void decode(polytone_tag_execution_id<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
