#pragma once
#include <conduit/schema/callback_info.hpp>
#include <conduit/schema/encoding/scale/domain.hpp>
#include <conduit/schema/encoding/scale/execution_result.hpp>
#include <conduit/schema/encoding/scale/expiration.hpp>
#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <conduit/schema/encoding/scale/processor_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const processor_callback_info<1>& o, ::scale::Encoder& encoder);
void decode(processor_callback_info<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
