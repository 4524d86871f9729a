#include <mandate/schema/encoding/scale/balance_lock.hpp>

namespace mandate::enforcer {

void encode(const token_balance_gte_enforcer::lock_t& o,
            ::scale::Encoder& encoder) {
  ::scale::encode(o.locked, encoder);
  ::scale::encode(o.balance_before, encoder);
}

void decode(token_balance_gte_enforcer::lock_t& o, ::scale::Decoder& decoder) {
  ::scale::decode(o.locked, decoder);
  ::scale::decode(o.balance_before, decoder);
}

}  // namespace mandate::enforcer
