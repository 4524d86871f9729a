#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: execution mode.
// Redemption workflow: selects single or batched executions and whether a
// failing sub-call aborts the hop (default) or is suppressed (try).
namespace mandate::schema {

enum class call_type_t : uint8_t {
  single = 0,
  batch = 1,
};

enum class exec_type_t : uint8_t {
  default_ = 0,
  try_ = 1,
};

struct execution_mode_t final {
  call_type_t call_type{call_type_t::single};
  exec_type_t exec_type{exec_type_t::default_};

  bool operator==(const execution_mode_t&) const = default;
};

inline constexpr auto kSingleDefaultMode =
    execution_mode_t{call_type_t::single, exec_type_t::default_};
inline constexpr auto kSingleTryMode =
    execution_mode_t{call_type_t::single, exec_type_t::try_};
inline constexpr auto kBatchDefaultMode =
    execution_mode_t{call_type_t::batch, exec_type_t::default_};
inline constexpr auto kBatchTryMode =
    execution_mode_t{call_type_t::batch, exec_type_t::try_};

inline constexpr std::string_view to_string(const call_type_t value) {
  switch (value) {
    case call_type_t::single:
      return "single";
    case call_type_t::batch:
      return "batch";
  }
  return "unknown";
}

inline constexpr std::string_view to_string(const exec_type_t value) {
  switch (value) {
    case exec_type_t::default_:
      return "default";
    case exec_type_t::try_:
      return "try";
  }
  return "unknown";
}

/// `<call type>/<exec type>`, e.g. `batch/try`.
inline std::string to_string(const execution_mode_t& mode) {
  auto text = std::string{to_string(mode.call_type)};
  text += '/';
  text += to_string(mode.exec_type);
  return text;
}

/// Inverse of `to_string(execution_mode_t)`. A bare call type implies the
/// default exec type.
inline std::optional<execution_mode_t> parse_execution_mode(
    const std::string_view text) {
  auto separator = text.find('/');
  auto call = text.substr(0, separator);
  auto exec = separator == std::string_view::npos ? std::string_view{"default"}
                                                  : text.substr(separator + 1);

  auto mode = execution_mode_t{};
  if (call == "single") {
    mode.call_type = call_type_t::single;
  } else if (call == "batch") {
    mode.call_type = call_type_t::batch;
  } else {
    return std::nullopt;
  }
  if (exec == "default") {
    mode.exec_type = exec_type_t::default_;
  } else if (exec == "try") {
    mode.exec_type = exec_type_t::try_;
  } else {
    return std::nullopt;
  }
  return mode;
}

}  // namespace mandate::schema
