#pragma once
#include <mandate/schema/primitives.hpp>

// Schema type: environment.
// Redemption workflow: the clock enforcers compare time windows, streams and
// periods against. Set by the host before each redemption.
namespace mandate::schema {

struct environment_t final {
  timestamp_seconds_t timestamp{};
  uint64_t height{};
};

}  // namespace mandate::schema
