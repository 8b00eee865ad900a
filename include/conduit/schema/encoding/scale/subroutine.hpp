#pragma once
#include <conduit/schema/subroutine.hpp>
#include <conduit/schema/encoding/scale/function.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const atomic_subroutine<1>& o, ::scale::Encoder& encoder);
void decode(atomic_subroutine<1>& o, ::scale::Decoder& decoder);

void encode(const non_atomic_subroutine<1>& o, ::scale::Encoder& encoder);
void decode(non_atomic_subroutine<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
