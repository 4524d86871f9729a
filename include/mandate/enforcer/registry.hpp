#pragma once

#include <mandate/enforcer/caveat_enforcer.hpp>
#include <mandate/schema/primitives.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mandate::enforcer {

/// Address an enforcer is installed at: the trailing 20 bytes of
/// BLAKE3("mandate.enforcer.<name>").
mandate::schema::address_t make_enforcer_address(std::string_view name);

/// Resolves `caveat_t::enforcer` references to enforcer instances.
class registry final {
 public:
  /// Install an enforcer at its derived address and return that address.
  mandate::schema::address_t add(std::unique_ptr<caveat_enforcer> enforcer);

  caveat_enforcer* find(const mandate::schema::address_t& address) const;
  std::optional<mandate::schema::address_t> address_of(
      std::string_view name) const;

  /// Address of a registered enforcer; unknown names are a programming error.
  mandate::schema::address_t at(std::string_view name) const;

  std::vector<std::pair<std::string, mandate::schema::address_t>> list() const;

 private:
  std::map<mandate::schema::address_t, std::unique_ptr<caveat_enforcer>>
      enforcers_;
  std::map<std::string, mandate::schema::address_t, std::less<>> names_;
};

/// Registry holding every built-in enforcer.
registry make_default_registry();

}  // namespace mandate::enforcer
