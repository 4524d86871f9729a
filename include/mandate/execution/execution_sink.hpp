#pragma once

#include <mandate/schema/execution.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/result.hpp>

namespace mandate::execution {

/// The only side-effecting primitive of the engine: runs one execution on
/// behalf of `account`. Return data goes in `result_t::data`.
class execution_sink {
 public:
  virtual ~execution_sink() = default;

  virtual mandate::schema::result_t execute(
      const mandate::schema::address_t& account,
      const mandate::schema::execution_t& execution) = 0;
};

}  // namespace mandate::execution
