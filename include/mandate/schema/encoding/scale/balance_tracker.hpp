#pragma once
#include <mandate/enforcer/balance_tracker.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::enforcer {

void encode(const balance_tracker_t& o, ::scale::Encoder& encoder);
void decode(balance_tracker_t& o, ::scale::Decoder& decoder);

}  // namespace mandate::enforcer
