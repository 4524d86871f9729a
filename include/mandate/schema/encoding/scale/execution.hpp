#pragma once
#include <mandate/schema/execution.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace mandate::schema {

void encode(const execution<1>& o, ::scale::Encoder& encoder);
void decode(execution<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
