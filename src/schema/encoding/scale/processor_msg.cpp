#include <conduit/schema/encoding/scale/processor_msg.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const processor_instantiate<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.authorization_contract, encoder);
  encode(o.processor_domain, encoder);
}

void decode(processor_instantiate<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.authorization_contract, decoder);
  decode(o.processor_domain, decoder);
}

void encode(const update_config<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.authorization_contract, encoder);
  encode(o.processor_domain, encoder);
}

void decode(update_config<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.authorization_contract, decoder);
  decode(o.processor_domain, decoder);
}

void encode(const enqueue_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.msgs, encoder);
  encode(o.subroutine, encoder);
  encode(o.priority, encoder);
  encode(o.expiration_time, encoder);
}

void decode(enqueue_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.msgs, decoder);
  decode(o.subroutine, decoder);
  decode(o.priority, decoder);
  decode(o.expiration_time, decoder);
}

void encode(const evict_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.queue_position, encoder);
  encode(o.priority, encoder);
}

void decode(evict_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.queue_position, decoder);
  decode(o.priority, decoder);
}

void encode(const insert_msgs<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.queue_position, encoder);
  encode(o.msgs, encoder);
  encode(o.subroutine, encoder);
  encode(o.priority, encoder);
  encode(o.expiration_time, encoder);
}

void decode(insert_msgs<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.queue_position, decoder);
  decode(o.msgs, decoder);
  decode(o.subroutine, decoder);
  decode(o.priority, decoder);
  decode(o.expiration_time, decoder);
}

void encode(const pause<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(pause<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const resume<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(resume<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const tick<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(tick<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const retry_callback<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
}

void decode(retry_callback<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
}

void encode(const retry_proxy_creation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(retry_proxy_creation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const function_confirmation<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.msg, encoder);
}

void decode(function_confirmation<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.msg, decoder);
}

void encode(const execute_atomic<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.batch, encoder);
}

void decode(execute_atomic<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.batch, decoder);
}

}  // namespace conduit::schema
