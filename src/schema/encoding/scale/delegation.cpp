#include <mandate/schema/encoding/scale/delegation.hpp>

namespace mandate::schema {

void encode(const delegation<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.delegate, encoder);
  ::scale::encode(o.delegator, encoder);
  ::scale::encode(o.authority, encoder);
  ::scale::encode(o.caveats, encoder);
  ::scale::encode(o.salt, encoder);
  ::scale::encode(o.signature, encoder);
}

void decode(delegation<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.delegate, decoder);
  ::scale::decode(o.delegator, decoder);
  ::scale::decode(o.authority, decoder);
  ::scale::decode(o.caveats, decoder);
  ::scale::decode(o.salt, decoder);
  ::scale::decode(o.signature, decoder);
}

}  // namespace mandate::schema
