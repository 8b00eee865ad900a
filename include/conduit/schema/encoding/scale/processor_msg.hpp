#pragma once
#include <conduit/schema/processor_msg.hpp>
#include <conduit/schema/encoding/scale/authorization.hpp>
#include <conduit/schema/encoding/scale/hyperlane.hpp>
#include <conduit/schema/encoding/scale/message_batch.hpp>
#include <conduit/schema/encoding/scale/polytone.hpp>
#include <conduit/schema/encoding/scale/processor_config.hpp>
#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <conduit/schema/encoding/scale/subroutine.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const processor_instantiate<1>& o, ::scale::Encoder& encoder);
void decode(processor_instantiate<1>& o, ::scale::Decoder& decoder);

void encode(const update_config<1>& o, ::scale::Encoder& encoder);
void decode(update_config<1>& o, ::scale::Decoder& decoder);

void encode(const enqueue_msgs<1>& o, ::scale::Encoder& encoder);
void decode(enqueue_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const evict_msgs<1>& o, ::scale::Encoder& encoder);
void decode(evict_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const insert_msgs<1>& o, ::scale::Encoder& encoder);
void decode(insert_msgs<1>& o, ::scale::Decoder& decoder);

void encode(const pause<1>& o, ::scale::Encoder& encoder);
void decode(pause<1>& o, ::scale::Decoder& decoder);

void encode(const resume<1>& o, ::scale::Encoder& encoder);
void decode(resume<1>& o, ::scale::Decoder& decoder);

void encode(const tick<1>& o, ::scale::Encoder& encoder);
void decode(tick<1>& o, ::scale::Decoder& decoder);

void encode(const retry_callback<1>& o, ::scale::Encoder& encoder);
void decode(retry_callback<1>& o, ::scale::Decoder& decoder);

void encode(const retry_proxy_creation<1>& o, ::scale::Encoder& encoder);
void decode(retry_proxy_creation<1>& o, ::scale::Decoder& decoder);

void encode(const function_confirmation<1>& o, ::scale::Encoder& encoder);
void decode(function_confirmation<1>& o, ::scale::Decoder& decoder);

void encode(const execute_atomic<1>& o, ::scale::Encoder& encoder);
void decode(execute_atomic<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
