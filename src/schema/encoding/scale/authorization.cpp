#include <conduit/schema/encoding/scale/authorization.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const address_allowance<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.address, encoder);
  encode(o.amount, encoder);
}

void decode(address_allowance<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.address, decoder);
  decode(o.amount, decoder);
}

void encode(const permission_with_call_limit<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.allowances, encoder);
}

void decode(permission_with_call_limit<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.allowances, decoder);
}

void encode(const permission_without_call_limit<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.addresses, encoder);
}

void decode(permission_without_call_limit<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.addresses, decoder);
}

void encode(const mode_permissionless<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(mode_permissionless<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const mode_permissioned<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.permission, encoder);
}

void decode(mode_permissioned<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.permission, decoder);
}

void encode(const lifetime_forever<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(lifetime_forever<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const lifetime_seconds<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.seconds, encoder);
}

void decode(lifetime_seconds<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.seconds, decoder);
}

void encode(const lifetime_blocks<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.blocks, encoder);
}

void decode(lifetime_blocks<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.blocks, decoder);
}

void encode(const authorization_info<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.mode, encoder);
  encode(o.not_before, encoder);
  encode(o.duration, encoder);
  encode(o.max_concurrent_executions, encoder);
  encode(o.subroutine, encoder);
  encode(o.priority, encoder);
}

void decode(authorization_info<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.mode, decoder);
  decode(o.not_before, decoder);
  decode(o.duration, decoder);
  decode(o.max_concurrent_executions, decoder);
  decode(o.subroutine, decoder);
  decode(o.priority, decoder);
}

void encode(const authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.mode, encoder);
  encode(o.not_before, encoder);
  encode(o.expiration, encoder);
  encode(o.max_concurrent_executions, encoder);
  encode(o.subroutine, encoder);
  encode(o.priority, encoder);
  encode(o.state, encoder);
}

void decode(authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.mode, decoder);
  decode(o.not_before, decoder);
  decode(o.expiration, decoder);
  decode(o.max_concurrent_executions, decoder);
  decode(o.subroutine, decoder);
  decode(o.priority, decoder);
  decode(o.state, decoder);
}

}  // namespace conduit::schema
