#pragma once
#include <conduit/schema/message_batch.hpp>
#include <conduit/schema/encoding/scale/authorization.hpp>
#include <conduit/schema/encoding/scale/expiration.hpp>
#include <conduit/schema/encoding/scale/processor_message.hpp>
#include <conduit/schema/encoding/scale/subroutine.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const message_batch<1>& o, ::scale::Encoder& encoder);
void decode(message_batch<1>& o, ::scale::Decoder& decoder);

void encode(const current_retry<1>& o, ::scale::Encoder& encoder);
void decode(current_retry<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
