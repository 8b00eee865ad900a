#pragma once
#include <conduit/schema/authorization.hpp>
#include <conduit/schema/encoding/scale/expiration.hpp>
#include <conduit/schema/encoding/scale/subroutine.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace conduit::schema {

void encode(const address_allowance<1>& o, ::scale::Encoder& encoder);
void decode(address_allowance<1>& o, ::scale::Decoder& decoder);

void encode(const permission_with_call_limit<1>& o, ::scale::Encoder& encoder);
void decode(permission_with_call_limit<1>& o, ::scale::Decoder& decoder);

void encode(const permission_without_call_limit<1>& o, ::scale::Encoder& encoder);
void decode(permission_without_call_limit<1>& o, ::scale::Decoder& decoder);

void encode(const mode_permissionless<1>& o, ::scale::Encoder& encoder);
void decode(mode_permissionless<1>& o, ::scale::Decoder& decoder);

void encode(const mode_permissioned<1>& o, ::scale::Encoder& encoder);
void decode(mode_permissioned<1>& o, ::scale::Decoder& decoder);

void encode(const lifetime_forever<1>& o, ::scale::Encoder& encoder);
void decode(lifetime_forever<1>& o, ::scale::Decoder& decoder);

void encode(const lifetime_seconds<1>& o, ::scale::Encoder& encoder);
void decode(lifetime_seconds<1>& o, ::scale::Decoder& decoder);

void encode(const lifetime_blocks<1>& o, ::scale::Encoder& encoder);
void decode(lifetime_blocks<1>& o, ::scale::Decoder& decoder);

void encode(const authorization_info<1>& o, ::scale::Encoder& encoder);
void decode(authorization_info<1>& o, ::scale::Decoder& decoder);

void encode(const authorization<1>& o, ::scale::Encoder& encoder);
void decode(authorization<1>& o, ::scale::Decoder& decoder);

}  // namespace conduit::schema
