#pragma once
#include <mandate/schema/primitives.hpp>

#include <variant>
#include <vector>

// Schema type: execution.
// Redemption workflow: the unit of work a delegation chain ultimately
// authorizes, run on behalf of the root delegator.
namespace mandate::schema {

template <uint16_t Version>
struct execution;

template <>
struct execution<1> final {
  uint16_t version{1};
  address_t target{};
  amount_t value{};
  bytes_t payload;

  bool operator==(const execution<1>&) const = default;
};

using execution_t = execution<1>;
using execution_batch_t = std::vector<execution_t>;
using execution_payload_t = std::variant<execution_t, execution_batch_t>;

inline execution_t make_execution(const address_t& target,
                                  const amount_t& value,
                                  bytes_t payload) {
  return execution_t{.target = target,
                     .value = value,
                     .payload = std::move(payload)};
}

/// Flatten a payload into the executions it describes.
inline execution_batch_t executions_of(const execution_payload_t& payload) {
  return std::visit(overloaded{[](const execution_t& single) {
                                 return execution_batch_t{single};
                               },
                               [](const execution_batch_t& batch) {
                                 return batch;
                               }},
                    payload);
}

}  // namespace mandate::schema
