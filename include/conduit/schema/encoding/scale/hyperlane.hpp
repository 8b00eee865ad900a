#pragma once
#include <conduit/schema/hyperlane.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const hyperlane_dispatch<1>& o, ::scale::Encoder& encoder);
void decode(hyperlane_dispatch<1>& o, ::scale::Decoder& decoder);

void encode(const hyperlane_handle<1>& o, ::scale::Encoder& encoder);
void decode(hyperlane_handle<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
