#include <conduit/schema/encoding/scale/message_batch.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const message_batch<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.msgs, encoder);
  encode(o.subroutine, encoder);
  encode(o.priority, encoder);
  encode(o.expiration_time, encoder);
}

void decode(message_batch<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.msgs, decoder);
  decode(o.subroutine, decoder);
  decode(o.priority, decoder);
  decode(o.expiration_time, decoder);
}

void encode(const current_retry<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.retry_amounts, encoder);
  encode(o.retry_cooldown, encoder);
}

void decode(current_retry<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.retry_amounts, decoder);
  decode(o.retry_cooldown, decoder);
}

}  // namespace conduit::schema
