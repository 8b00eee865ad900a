#pragma once
#include <conduit/schema/function.hpp>
#include <conduit/schema/encoding/scale/domain.hpp>
#include <conduit/schema/encoding/scale/expiration.hpp>
#include <conduit/schema/encoding/scale/message_details.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const retry_indefinitely<1>& o, ::scale::Encoder& encoder);
void decode(retry_indefinitely<1>& o, ::scale::Decoder& decoder);

void encode(const retry_amount<1>& o, ::scale::Encoder& encoder);
void decode(retry_amount<1>& o, ::scale::Decoder& decoder);

void encode(const retry_logic<1>& o, ::scale::Encoder& encoder);
void decode(retry_logic<1>& o, ::scale::Decoder& decoder);

void encode(const function_callback<1>& o, ::scale::Encoder& encoder);
void decode(function_callback<1>& o, ::scale::Decoder& decoder);

void encode(const atomic_function<1>& o, ::scale::Encoder& encoder);
void decode(atomic_function<1>& o, ::scale::Decoder& decoder);

void encode(const non_atomic_function<1>& o, ::scale::Encoder& encoder);
void decode(non_atomic_function<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
