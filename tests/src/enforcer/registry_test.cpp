#include <gtest/gtest.h>
#include <mandate/enforcer/limited_calls_enforcer.hpp>
#include <mandate/enforcer/logical_or_wrapper_enforcer.hpp>
#include <mandate/enforcer/registry.hpp>

#include <algorithm>
#include <set>

TEST(registry, enforcer_addresses_are_derived_from_names) {
  auto first = mandate::enforcer::make_enforcer_address("limited_calls");
  auto second = mandate::enforcer::make_enforcer_address("limited_calls");
  auto other = mandate::enforcer::make_enforcer_address("nonce");
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other);
  EXPECT_NE(first, mandate::schema::address_t{});
}

TEST(registry, default_registry_resolves_every_builtin) {
  auto enforcers = mandate::enforcer::make_default_registry();
  auto entries = enforcers.list();
  EXPECT_EQ(entries.size(), 34u);

  auto addresses = std::set<mandate::schema::address_t>{};
  for (const auto& [name, address] : entries) {
    addresses.insert(address);
    EXPECT_EQ(address, mandate::enforcer::make_enforcer_address(name));
    auto* enforcer = enforcers.find(address);
    ASSERT_NE(enforcer, nullptr) << name;
    EXPECT_EQ(enforcer->name(), name);
  }
  EXPECT_EQ(addresses.size(), entries.size());
  EXPECT_TRUE(std::is_sorted(std::begin(entries), std::end(entries)));
}

TEST(registry, lookups_by_name_and_address) {
  auto enforcers = mandate::enforcer::make_default_registry();
  auto address =
      enforcers.address_of(mandate::enforcer::limited_calls_enforcer::kName);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(*address, enforcers.at("limited_calls"));
  EXPECT_EQ(enforcers.find(*address)->name(), "limited_calls");

  EXPECT_FALSE(enforcers.address_of("no_such_enforcer").has_value());
  EXPECT_EQ(enforcers.find(mandate::schema::address_t{}), nullptr);
}

TEST(registry, custom_registry_holds_only_what_was_added) {
  auto enforcers = mandate::enforcer::registry{};
  auto address = enforcers.add(
      std::make_unique<mandate::enforcer::logical_or_wrapper_enforcer>());
  EXPECT_EQ(address, mandate::enforcer::make_enforcer_address(
                         mandate::enforcer::logical_or_wrapper_enforcer::kName));
  EXPECT_EQ(enforcers.list().size(), 1u);
  EXPECT_FALSE(enforcers.address_of("limited_calls").has_value());
}
