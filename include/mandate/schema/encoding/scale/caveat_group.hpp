#pragma once
#include <mandate/enforcer/logical_or_wrapper_enforcer.hpp>
#include <mandate/schema/encoding/scale/caveat.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::enforcer {

void encode(const logical_or_wrapper_enforcer::caveat_group_t& o,
            ::scale::Encoder& encoder);
void decode(logical_or_wrapper_enforcer::caveat_group_t& o,
            ::scale::Decoder& decoder);

void encode(const logical_or_wrapper_enforcer::selected_group_t& o,
            ::scale::Encoder& encoder);
void decode(logical_or_wrapper_enforcer::selected_group_t& o,
            ::scale::Decoder& decoder);

}  // namespace mandate::enforcer
