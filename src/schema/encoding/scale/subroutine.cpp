#include <conduit/schema/encoding/scale/subroutine.hpp>
#include <scale/scale.hpp>

namespace conduit::schema {

void encode(const atomic_subroutine<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.functions, encoder);
  encode(o.retry_logic, encoder);
  encode(o.expiration_time, encoder);
}

void decode(atomic_subroutine<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.functions, decoder);
  decode(o.retry_logic, decoder);
  decode(o.expiration_time, decoder);
}

void encode(const non_atomic_subroutine<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.functions, encoder);
  encode(o.expiration_time, encoder);
}

void decode(non_atomic_subroutine<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.functions, decoder);
  decode(o.expiration_time, decoder);
}

}  // namespace conduit::schema
