#include <mandate/schema/encoding/scale/balance_tracker.hpp>

namespace mandate::enforcer {

void encode(const balance_tracker_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.balance_before, encoder);
  ::scale::encode(o.expected_increase, encoder);
  ::scale::encode(o.expected_decrease, encoder);
  ::scale::encode(o.pending, encoder);
}

void decode(balance_tracker_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.balance_before, decoder);
  ::scale::decode(o.expected_increase, decoder);
  ::scale::decode(o.expected_decrease, decoder);
  ::scale::decode(o.pending, decoder);
}

}  // namespace mandate::enforcer
