#pragma once
#include <mandate/schema/delegation.hpp>
#include <mandate/schema/encoding/scale/caveat.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::schema {

void encode(const delegation<1>& o, ::scale::Encoder& encoder);
void decode(delegation<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
