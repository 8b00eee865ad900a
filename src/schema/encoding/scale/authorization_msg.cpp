#include <conduit/schema/encoding/scale/authorization_msg.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const registry_instantiate<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.sub_owners, encoder);
  encode(o.processor, encoder);
}

void decode(registry_instantiate<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.sub_owners, decoder);
  decode(o.processor, decoder);
}

void encode(const add_sub_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sub_owner, encoder);
}

void decode(add_sub_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sub_owner, decoder);
}

void encode(const remove_sub_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sub_owner, encoder);
}

void decode(remove_sub_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sub_owner, decoder);
}

void encode(const add_external_domains<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.external_domains, encoder);
}

void decode(add_external_domains<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.external_domains, decoder);
}

void encode(const create_authorizations<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authorizations, encoder);
}

void decode(create_authorizations<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authorizations, decoder);
}

void encode(const modify_authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.not_before, encoder);
  encode(o.expiration, encoder);
  encode(o.max_concurrent_executions, encoder);
  encode(o.priority, encoder);
}

void decode(modify_authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.not_before, decoder);
  decode(o.expiration, decoder);
  decode(o.max_concurrent_executions, decoder);
  decode(o.priority, decoder);
}

void encode(const disable_authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
}

void decode(disable_authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
}

void encode(const enable_authorization<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
}

void decode(enable_authorization<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
}

void encode(const mint_authorizations<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.mints, encoder);
}

void decode(mint_authorizations<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.mints, decoder);
}

void encode(const remove_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
  encode(o.queue_position, encoder);
  encode(o.priority, encoder);
}

void decode(remove_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
  decode(o.queue_position, decoder);
  decode(o.priority, decoder);
}

void encode(const add_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.queue_position, encoder);
  encode(o.priority, encoder);
  encode(o.messages, encoder);
}

void decode(add_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.queue_position, decoder);
  decode(o.priority, decoder);
  decode(o.messages, decoder);
}

void encode(const pause_processor<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
}

void decode(pause_processor<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
}

void encode(const resume_processor<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain, encoder);
}

void decode(resume_processor<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain, decoder);
}

void encode(const send_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.messages, encoder);
  encode(o.ttl, encoder);
}

void decode(send_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.messages, decoder);
  decode(o.ttl, decoder);
}

void encode(const processor_callback<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.execution_result, encoder);
}

void decode(processor_callback<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.execution_result, decoder);
}

void encode(const retry_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
}

void decode(retry_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
}

void encode(const retry_bridge_creation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain_name, encoder);
}

void decode(retry_bridge_creation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain_name, decoder);
}

}  // namespace conduit::schema
