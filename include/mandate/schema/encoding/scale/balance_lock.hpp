#pragma once
#include <mandate/enforcer/token_balance_gte_enforcer.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::enforcer {

void encode(const token_balance_gte_enforcer::lock_t& o,
            ::scale::Encoder& encoder);
void decode(token_balance_gte_enforcer::lock_t& o, ::scale::Decoder& decoder);

}  // namespace mandate::enforcer
