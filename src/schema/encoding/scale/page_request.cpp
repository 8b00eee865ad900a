#include <conduit/schema/encoding/scale/page_request.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const page_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.start_after, encoder);
  encode(o.limit, encoder);
}

void decode(page_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.start_after, decoder);
  decode(o.limit, decoder);
}

void encode(const id_page_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.start_after, encoder);
  encode(o.limit, encoder);
}

void decode(id_page_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.start_after, decoder);
  decode(o.limit, decoder);
}

void encode(const mint_balance_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.label, encoder);
  encode(o.address, encoder);
}

void decode(mint_balance_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.label, decoder);
  decode(o.address, decoder);
}

void encode(const queue_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.priority, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
}

void decode(queue_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.priority, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
}

}  // namespace conduit::schema
