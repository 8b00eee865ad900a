#pragma once
#include <conduit/schema/cosmos_msg.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const wasm_execute<1>& o, ::scale::Encoder& encoder);
void decode(wasm_execute<1>& o, ::scale::Decoder& decoder);

void encode(const wasm_migrate<1>& o, ::scale::Encoder& encoder);
void decode(wasm_migrate<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
