#pragma once
#include <conduit/schema/message_details.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const must_be_included<1>& o, ::scale::Encoder& encoder);
void decode(must_be_included<1>& o, ::scale::Decoder& decoder);

void encode(const cannot_be_included<1>& o, ::scale::Encoder& encoder);
void decode(cannot_be_included<1>& o, ::scale::Decoder& decoder);

void encode(const must_be_value<1>& o, ::scale::Encoder& encoder);
void decode(must_be_value<1>& o, ::scale::Decoder& decoder);

void encode(const message_definition<1>& o, ::scale::Encoder& encoder);
void decode(message_definition<1>& o, ::scale::Decoder& decoder);

void encode(const message_details<1>& o, ::scale::Encoder& encoder);
void decode(message_details<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
