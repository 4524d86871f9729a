#pragma once
#include <mandate/enforcer/period_transfer_enforcer.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::enforcer {

void encode(const period_state_t& o, ::scale::Encoder& encoder);
void decode(period_state_t& o, ::scale::Decoder& decoder);

}  // namespace mandate::enforcer
