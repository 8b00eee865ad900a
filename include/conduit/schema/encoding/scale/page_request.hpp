#pragma once
#include <conduit/schema/page_request.hpp>
#include <conduit/schema/encoding/scale/authorization.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const page_request<1>& o, ::scale::Encoder& encoder);
void decode(page_request<1>& o, ::scale::Decoder& decoder);

void encode(const id_page_request<1>& o, ::scale::Encoder& encoder);
void decode(id_page_request<1>& o, ::scale::Decoder& decoder);

void encode(const mint_balance_request<1>& o, ::scale::Encoder& encoder);
void decode(mint_balance_request<1>& o, ::scale::Decoder& decoder);

void encode(const queue_request<1>& o, ::scale::Encoder& encoder);
void decode(queue_request<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
