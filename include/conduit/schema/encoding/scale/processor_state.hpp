#pragma once
#include <conduit/schema/processor_state.hpp>
#include <conduit/schema/encoding/scale/execution_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const pending_operation<1>& o, ::scale::Encoder& encoder);
void decode(pending_operation<1>& o, ::scale::Decoder& decoder);

void encode(const pending_confirmation<1>& o, ::scale::Encoder& encoder);
void decode(pending_confirmation<1>& o, ::scale::Decoder& decoder);

void encode(const bridge_state<1>& o, ::scale::Encoder& encoder);
void decode(bridge_state<1>& o, ::scale::Decoder& decoder);

void encode(const pending_bridge_callback<1>& o, ::scale::Encoder& encoder);
void decode(pending_bridge_callback<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
