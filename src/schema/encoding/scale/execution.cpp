#include <mandate/schema/encoding/scale/execution.hpp>

namespace mandate::schema {

void encode(const execution<1>& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.version, encoder);
  ::scale::encode(o.target, encoder);
  ::scale::encode(o.value, encoder);
  ::scale::encode(o.payload, encoder);
}

void decode(execution<1>& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.version, decoder);
  ::scale::decode(o.target, decoder);
  ::scale::decode(o.value, decoder);
  ::scale::decode(o.payload, decoder);
}

}  // namespace mandate::schema
