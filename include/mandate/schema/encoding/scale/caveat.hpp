#pragma once
#include <mandate/schema/caveat.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::schema {

void encode(const caveat<1>& o, ::scale::Encoder& encoder);
void decode(caveat<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
