#include <conduit/schema/encoding/scale/transaction.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.sender, encoder);
  encode(o.contract, encoder);
  encode(o.msg, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.sender, decoder);
  decode(o.contract, decoder);
  decode(o.msg, decoder);
}

}  // namespace conduit::schema
