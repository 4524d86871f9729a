#include <mandate/schema/encoding/scale/caveat.hpp>

namespace mandate::schema {

void encode(const caveat<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.enforcer, encoder);
  ::scale::encode(o.terms, encoder);
  ::scale::encode(o.args, encoder);
}

void decode(caveat<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.enforcer, decoder);
  ::scale::decode(o.terms, decoder);
  ::scale::decode(o.args, decoder);
}

}  // namespace mandate::schema
