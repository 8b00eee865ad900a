#pragma once
#include <conduit/schema/execution_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const result_in_process<1>& o, ::scale::Encoder& encoder);
void decode(result_in_process<1>& o, ::scale::Decoder& decoder);

void encode(const result_success<1>& o, ::scale::Encoder& encoder);
void decode(result_success<1>& o, ::scale::Decoder& decoder);

void encode(const result_rejected<1>& o, ::scale::Encoder& encoder);
void decode(result_rejected<1>& o, ::scale::Decoder& decoder);

void encode(const result_partially_executed<1>& o, ::scale::Encoder& encoder);
void decode(result_partially_executed<1>& o, ::scale::Decoder& decoder);

void encode(const result_removed_by_owner<1>& o, ::scale::Encoder& encoder);
void decode(result_removed_by_owner<1>& o, ::scale::Decoder& decoder);

void encode(const result_timeout<1>& o, ::scale::Encoder& encoder);
void decode(result_timeout<1>& o, ::scale::Decoder& decoder);

void encode(const result_expired<1>& o, ::scale::Encoder& encoder);
void decode(result_expired<1>& o, ::scale::Decoder& decoder);

void encode(const result_unexpected_error<1>& o, ::scale::Encoder& encoder);
void decode(result_unexpected_error<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
