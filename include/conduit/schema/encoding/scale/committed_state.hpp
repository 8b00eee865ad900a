#pragma once
#include <conduit/storage/storage.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::storage {

void encode(const committed_state& o, ::scale::Encoder& encoder);
void decode(committed_state& o, ::scale::Decoder& decoder);

}  // namespace conduit::storage
