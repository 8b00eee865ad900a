#include <conduit/schema/encoding/scale/committed_state.hpp>
#include <scale/scale.hpp>

namespace conduit::storage {

void encode(const committed_state& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
  encode(o.time, encoder);
  encode(o.app_hash, encoder);
}

void decode(committed_state& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
  decode(o.time, decoder);
  decode(o.app_hash, decoder);
}

}  // namespace conduit::storage
