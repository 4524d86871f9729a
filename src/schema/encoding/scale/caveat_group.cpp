#include <mandate/schema/encoding/scale/caveat_group.hpp>

namespace mandate::enforcer {

void encode(const logical_or_wrapper_enforcer::caveat_group_t& o,
            ::scale::Encoder& encoder) {
  ::scale::encode(o.caveats, encoder);
}

void decode(logical_or_wrapper_enforcer::caveat_group_t& o,
            ::scale::Decoder& decoder) {
  ::scale::decode(o.caveats, decoder);
}

void encode(const logical_or_wrapper_enforcer::selected_group_t& o,
            ::scale::Encoder& encoder) {
  ::scale::encode(o.group_index, encoder);
  ::scale::encode(o.caveat_args, encoder);
}

void decode(logical_or_wrapper_enforcer::selected_group_t& o,
            ::scale::Decoder& decoder) {
  ::scale::decode(o.group_index, decoder);
  ::scale::decode(o.caveat_args, decoder);
}

}  // namespace mandate::enforcer
