#include <conduit/schema/encoding/scale/execution_result.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const result_in_process<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(result_in_process<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const result_success<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(result_success<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const result_rejected<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.error, encoder);
}

void decode(result_rejected<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.error, decoder);
}

void encode(const result_partially_executed<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.executed_count, encoder);
  encode(o.error, encoder);
}

void decode(result_partially_executed<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.executed_count, decoder);
  decode(o.error, decoder);
}

void encode(const result_removed_by_owner<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
}

void decode(result_removed_by_owner<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
}

void encode(const result_timeout<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.retriable, encoder);
}

void decode(result_timeout<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.retriable, decoder);
}

void encode(const result_expired<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.executed_count, encoder);
}

void decode(result_expired<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.executed_count, decoder);
}

void encode(const result_unexpected_error<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.error, encoder);
}

void decode(result_unexpected_error<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.error, decoder);
}

}  // namespace conduit::schema
