#include <conduit/schema/encoding/scale/polytone.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const polytone_callback_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.receiver, encoder);
  encode(o.msg, encoder);
}

void decode(polytone_callback_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.receiver, decoder);
  decode(o.msg, decoder);
}

void encode(const polytone_execute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.msgs, encoder);
  encode(o.callback, encoder);
  encode(o.timeout_seconds, encoder);
}

void decode(polytone_execute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.msgs, decoder);
  decode(o.callback, decoder);
  decode(o.timeout_seconds, decoder);
}

void encode(const polytone_execute_success<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.responses, encoder);
}

void decode(polytone_execute_success<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.responses, decoder);
}

void encode(const polytone_execute_error<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.error, encoder);
}

void decode(polytone_execute_error<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.error, decoder);
}

void encode(const polytone_callback_message<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.initiator, encoder);
  encode(o.initiator_msg, encoder);
  encode(o.result, encoder);
}

void decode(polytone_callback_message<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.initiator, decoder);
  decode(o.initiator_msg, decoder);
  decode(o.result, decoder);
}

void encode(const polytone_tag_create_proxy<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.domain_name, encoder);
}

void decode(polytone_tag_create_proxy<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.domain_name, decoder);
}

void encode(const polytone_tag_execution_id<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
}

void decode(polytone_tag_execution_id<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
}

}  // namespace conduit::schema
