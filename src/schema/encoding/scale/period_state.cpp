#include <mandate/schema/encoding/scale/period_state.hpp>

namespace mandate::enforcer {

void encode(const period_state_t& o, ::scale::Encoder& encoder) {
  ::scale::encode(o.last_claim_period, encoder);
  ::scale::encode(o.claimed_in_period, encoder);
}

void decode(period_state_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.last_claim_period, decoder);
  ::scale::decode(o.claimed_in_period, decoder);
}

}  // namespace mandate::enforcer
