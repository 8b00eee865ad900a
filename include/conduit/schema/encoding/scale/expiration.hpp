#pragma once
#include <conduit/schema/expiration.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const expiration_never<1>& o, ::scale::Encoder& encoder);
void decode(expiration_never<1>& o, ::scale::Decoder& decoder);

void encode(const expiration_at_height<1>& o, ::scale::Encoder& encoder);
void decode(expiration_at_height<1>& o, ::scale::Decoder& decoder);

void encode(const expiration_at_time<1>& o, ::scale::Encoder& encoder);
void decode(expiration_at_time<1>& o, ::scale::Decoder& decoder);

void encode(const duration_height<1>& o, ::scale::Encoder& encoder);
void decode(duration_height<1>& o, ::scale::Decoder& decoder);

void encode(const duration_time<1>& o, ::scale::Encoder& encoder);
void decode(duration_time<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
