#pragma once
#include <conduit/schema/processor_config.hpp>
#include <conduit/schema/encoding/scale/domain.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const processor_domain_main<1>& o, ::scale::Encoder& encoder);
void decode(processor_domain_main<1>& o, ::scale::Decoder& decoder);

void encode(const processor_domain_polytone<1>& o, ::scale::Encoder& encoder);
void decode(processor_domain_polytone<1>& o, ::scale::Decoder& decoder);

void encode(const processor_domain_hyperlane<1>& o, ::scale::Encoder& encoder);
void decode(processor_domain_hyperlane<1>& o, ::scale::Decoder& decoder);

void encode(const processor_config<1>& o, ::scale::Encoder& encoder);
void decode(processor_config<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
