#include <gtest/gtest.h>
#include <mandate/common/checked_math.hpp>
#include <mandate/enforcer/limited_calls_enforcer.hpp>
#include <mandate/enforcer/nonce_enforcer.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <mandate/testing/common.hpp>
#include <mandate/testing/delegation_builder.hpp>
#include <mandate/testing/signer.hpp>
#include <mandate/testing/world.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace {

using mandate::testing::kAlice;
using mandate::testing::kBob;
using mandate::testing::kCarol;
using mandate::testing::kToken;

/// Appends "<phase>:<first terms byte>" for every hook it sees.
class recording_enforcer final : public mandate::enforcer::caveat_enforcer {
 public:
  explicit recording_enforcer(std::vector<std::string>& events)
      : events_{events} {}

  std::string_view name() const override { return "recording"; }

  mandate::schema::result_t check_terms(
      const mandate::schema::bytes_view_t&) const override {
    return mandate::schema::make_ok();
  }

  mandate::schema::result_t before_all_hook(
      mandate::enforcer::hook_context_t&,
      const mandate::enforcer::hook_call_t& call) override {
    return record("before_all", call);
  }
  mandate::schema::result_t before_hook(
      mandate::enforcer::hook_context_t&,
      const mandate::enforcer::hook_call_t& call) override {
    return record("before", call);
  }
  mandate::schema::result_t after_hook(
      mandate::enforcer::hook_context_t&,
      const mandate::enforcer::hook_call_t& call) override {
    return record("after", call);
  }
  mandate::schema::result_t after_all_hook(
      mandate::enforcer::hook_context_t&,
      const mandate::enforcer::hook_call_t& call) override {
    return record("after_all", call);
  }

 private:
  mandate::schema::result_t record(const std::string_view phase,
                                   const mandate::enforcer::hook_call_t& call) {
    events_.push_back(fmt::format("{}:{}", phase, call.terms[0]));
    return mandate::schema::make_ok();
  }

  std::vector<std::string>& events_;
};

mandate::schema::caveat_t recording_caveat(
    const mandate::schema::address_t& enforcer,
    const uint8_t label) {
  return mandate::schema::caveat_t{.enforcer = enforcer,
                                   .terms = mandate::schema::bytes_t{label}};
}

}  // namespace

TEST(delegation_manager, redeems_a_single_root_delegation) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kCarol, 25));

  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(world.balance(kToken, kAlice), 75);
  EXPECT_EQ(world.balance(kToken, kCarol), 25);
  EXPECT_EQ(world.manager.depth(), 0u);
  EXPECT_FALSE(world.store.in_transaction());

  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto data = encoder.decode<std::vector<std::vector<mandate::schema::bytes_t>>>(
      mandate::schema::bytes_view_t{result.data});
  ASSERT_EQ(data.size(), 1u);
  EXPECT_EQ(data[0].size(), 1u);
}

TEST(delegation_manager, empty_chain_executes_as_the_redeemer) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kBob, 10);

  auto result = world.redeem(
      kBob, {}, mandate::testing::make_token_transfer(kToken, kCarol, 10));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(world.balance(kToken, kBob), 0);
  EXPECT_EQ(world.balance(kToken, kCarol), 10);
}

TEST(delegation_manager, chain_executes_as_the_root_delegator) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto leaf = mandate::testing::make_child_delegation(root, kCarol);
  auto result = world.redeem(
      kCarol, {leaf, root},
      mandate::testing::make_token_transfer(kToken, kCarol, 40));

  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(world.balance(kToken, kAlice), 60);
  EXPECT_EQ(world.balance(kToken, kCarol), 40);
}

TEST(delegation_manager, rejects_mismatched_batch_lengths) {
  auto world = mandate::testing::world_t{};
  auto result = world.manager.redeem_delegations(
      kBob,
      std::vector<mandate::schema::permission_context_t>{
          mandate::schema::permission_context_t{}},
      std::vector<mandate::schema::execution_mode_t>{},
      std::vector<mandate::schema::execution_payload_t>{
          mandate::schema::execution_payload_t{}});
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::batch_length_mismatch);
  EXPECT_EQ(result.log, "manager:batch-length-mismatch");
  EXPECT_EQ(result.codespace, "mandate.manager");
}

TEST(delegation_manager, rejects_payload_shape_mismatch) {
  auto world = mandate::testing::world_t{};
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.redeem(
      kBob, {root},
      mandate::schema::execution_batch_t{
          mandate::testing::make_token_transfer(kToken, kCarol, 1)},
      mandate::schema::kSingleDefaultMode);
  EXPECT_EQ(result.log, "manager:invalid-call-type");
}

TEST(delegation_manager, rejects_wrong_redeemer) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.redeem(
      kCarol, {root}, mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::invalid_delegate);
  EXPECT_EQ(result.log, "manager:invalid-delegate");
}

TEST(delegation_manager, open_delegate_accepts_any_redeemer) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(
      kAlice, mandate::schema::kAnyDelegate);
  auto result = world.redeem(
      kCarol, {root}, mandate::testing::make_token_transfer(kToken, kCarol, 1));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(world.balance(kToken, kCarol), 1);
}

TEST(delegation_manager, rejects_broken_authority_links) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto leaf = mandate::testing::make_child_delegation(root, kCarol);
  leaf.authority = mandate::testing::make_hash(1);
  auto result = world.redeem(
      kCarol, {leaf, root},
      mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(result.log, "manager:invalid-authority");

  // The last delegation must carry the root authority.
  auto orphan = mandate::testing::make_root_delegation(kAlice, kBob);
  orphan.authority = mandate::testing::make_hash(2);
  result = world.redeem(
      kBob, {orphan}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::invalid_authority);
}

TEST(delegation_manager, rejects_broken_delegate_links) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto leaf = mandate::testing::make_child_delegation(root, kCarol);
  leaf.delegator = mandate::testing::kDave;
  auto result = world.redeem(
      kCarol, {leaf, root},
      mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(result.log, "manager:invalid-delegate");
}

TEST(delegation_manager, rejects_unknown_enforcers) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(
      kAlice, kBob,
      {mandate::schema::caveat_t{
          .enforcer = mandate::testing::make_address(0x99)}});
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::unknown_enforcer);
  EXPECT_EQ(world.balance(kToken, kAlice), 100);
}

TEST(delegation_manager, hooks_run_in_chain_order) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto events = std::vector<std::string>{};
  auto recorder =
      world.enforcers.add(std::make_unique<recording_enforcer>(events));
  world.sink.register_contract(
      mandate::testing::kDave,
      [&](const mandate::schema::address_t&, const mandate::schema::execution_t&) {
        events.push_back("execute");
        return mandate::schema::make_ok();
      });

  auto root = mandate::testing::make_root_delegation(
      kAlice, kBob, {recording_caveat(recorder, 2)});
  auto leaf = mandate::testing::make_child_delegation(
      root, kCarol, {recording_caveat(recorder, 1)});
  auto result = world.redeem(
      kCarol, {leaf, root},
      mandate::schema::make_execution(mandate::testing::kDave, 0,
                                      mandate::schema::bytes_t{0x01}));
  ASSERT_EQ(result.code, 0u) << result.log;

  auto expected = std::vector<std::string>{
      "before_all:2", "before_all:1", "before:2",    "before:1",
      "execute",      "after:1",      "after:2",     "after_all:1",
      "after_all:2"};
  EXPECT_EQ(events, expected);
}

TEST(delegation_manager, batched_contexts_share_all_phases) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto events = std::vector<std::string>{};
  auto recorder =
      world.enforcers.add(std::make_unique<recording_enforcer>(events));

  auto first = mandate::testing::make_root_delegation(
      kAlice, kBob, {recording_caveat(recorder, 1)}, 1);
  auto second = mandate::testing::make_root_delegation(
      kAlice, kBob, {recording_caveat(recorder, 2)}, 2);
  auto result = world.manager.redeem_delegations(
      kBob, {{first}, {second}},
      {mandate::schema::kSingleDefaultMode,
       mandate::schema::kSingleDefaultMode},
      {mandate::testing::make_token_transfer(kToken, kBob, 1),
       mandate::testing::make_token_transfer(kToken, kBob, 2)});
  ASSERT_EQ(result.code, 0u) << result.log;

  auto expected = std::vector<std::string>{
      "before_all:1", "before_all:2", "before:1",    "after:1",
      "before:2",     "after:2",      "after_all:1", "after_all:2"};
  EXPECT_EQ(events, expected);
  EXPECT_EQ(world.balance(kToken, kBob), 3);
}

TEST(delegation_manager, failure_rolls_back_the_whole_batch) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.manager.redeem_delegations(
      kBob, {{root}, {root}},
      {mandate::schema::kSingleDefaultMode,
       mandate::schema::kSingleDefaultMode},
      {mandate::testing::make_token_transfer(kToken, kBob, 60),
       mandate::testing::make_token_transfer(kToken, kBob, 60)});

  EXPECT_EQ(result.log, "ledger:insufficient-balance");
  EXPECT_EQ(world.balance(kToken, kAlice), 100);
  EXPECT_EQ(world.balance(kToken, kBob), 0);
  EXPECT_FALSE(world.store.in_transaction());
}

TEST(delegation_manager, caveat_failure_rolls_back_enforcer_state) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);

  auto limit = mandate::enforcer::limited_calls_enforcer::encode_terms(
      {.limit = 1});
  auto root = mandate::testing::make_root_delegation(
      kAlice, kBob,
      {world.caveat(mandate::enforcer::limited_calls_enforcer::kName, limit)});

  // The counter bump of a redemption whose execution fails is discarded.
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 500));
  EXPECT_NE(result.code, 0u);

  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 5));
  ASSERT_EQ(result.code, 0u) << result.log;

  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 5));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::limit_exceeded);
  EXPECT_EQ(world.balance(kToken, kBob), 5);
}

TEST(delegation_manager, arithmetic_errors_abort_the_redemption) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  world.sink.register_contract(
      mandate::testing::kDave,
      [](const mandate::schema::address_t&, const mandate::schema::execution_t&) {
        auto max = std::numeric_limits<mandate::schema::amount_t>::max();
        mandate::common::checked_add(max, 1);
        return mandate::schema::make_ok();
      });

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.redeem(
      kBob, {root},
      mandate::schema::make_execution(mandate::testing::kDave, 0,
                                      mandate::schema::bytes_t{0x01}));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::arithmetic_error);
  EXPECT_EQ(result.log, "manager:arithmetic-error:addition overflow");
  EXPECT_EQ(world.manager.depth(), 0u);
}

TEST(delegation_manager, disabled_delegations_cannot_be_redeemed) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto hash = world.manager.delegation_hash(root);

  auto result = world.manager.disable_delegation(kBob, root);
  EXPECT_EQ(result.log, "manager:invalid-delegator");

  ASSERT_EQ(world.manager.disable_delegation(kAlice, root).code, 0u);
  EXPECT_TRUE(world.manager.is_delegation_disabled(hash));
  EXPECT_FALSE(world.store.in_transaction());
  result = world.manager.disable_delegation(kAlice, root);
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::already_disabled);

  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.log, "manager:cannot-use-a-disabled-delegation");

  ASSERT_EQ(world.manager.enable_delegation(kAlice, root).code, 0u);
  result = world.manager.enable_delegation(kAlice, root);
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::already_enabled);

  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;
}

TEST(delegation_manager, disabling_a_parent_blocks_its_children) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto leaf = mandate::testing::make_child_delegation(root, kCarol);

  ASSERT_EQ(world.manager.disable_delegation(kAlice, root).code, 0u);
  auto result = world.redeem(
      kCarol, {leaf, root},
      mandate::testing::make_token_transfer(kToken, kCarol, 1));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::disabled_delegation);
}

TEST(delegation_manager, only_the_owner_can_pause) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);

  auto result = world.manager.pause(kAlice);
  EXPECT_EQ(result.log, "manager:unauthorized-caller");
  EXPECT_FALSE(world.manager.paused());

  ASSERT_EQ(world.manager.pause(mandate::testing::kOwner).code, 0u);
  EXPECT_TRUE(world.manager.paused());
  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.log, "manager:paused");

  EXPECT_EQ(world.manager.unpause(kBob).log, "manager:unauthorized-caller");
  ASSERT_EQ(world.manager.unpause(mandate::testing::kOwner).code, 0u);
  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;
}

TEST(delegation_manager, strict_mode_checks_signatures) {
  auto world = mandate::testing::world_t{true};
  auto signer = mandate::testing::ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  world.fund(kToken, signer->address(), 100);

  auto root = mandate::testing::make_root_delegation(signer->address(), kBob);
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.log, "manager:invalid-signature");

  signer->sign(root, mandate::testing::kManagerAddress);
  result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(world.balance(kToken, kBob), 1);

  // Args are not signed, so the redeemer may change them.
  auto with_args = mandate::testing::make_root_delegation(
      signer->address(), kBob,
      {world.caveat(mandate::enforcer::limited_calls_enforcer::kName,
                    mandate::enforcer::limited_calls_enforcer::encode_terms(
                        {.limit = 5}))},
      7);
  signer->sign(with_args, mandate::testing::kManagerAddress);
  with_args.caveats[0].args = mandate::schema::bytes_t{0x01, 0x02};
  result = world.redeem(
      kBob, {with_args},
      mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;

  // Terms are.
  with_args.caveats[0].terms =
      mandate::enforcer::limited_calls_enforcer::encode_terms({.limit = 6});
  result = world.redeem(
      kBob, {with_args},
      mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(mandate::schema::code_of(result),
            mandate::schema::error_code::invalid_signature);
}

TEST(delegation_manager, signatures_are_bound_to_one_manager) {
  auto world = mandate::testing::world_t{true};
  auto signer = mandate::testing::ed25519_signer::generate();
  ASSERT_TRUE(signer.has_value());
  world.fund(kToken, signer->address(), 100);

  auto root = mandate::testing::make_root_delegation(signer->address(), kBob);
  signer->sign(root, mandate::testing::make_address(0xEE));
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.log, "manager:invalid-signature");
}

TEST(delegation_manager, custom_verifier_replaces_the_default) {
  auto world = mandate::testing::world_t{true};
  world.fund(kToken, kAlice, 100);
  auto seen = mandate::schema::address_t{};
  world.manager.set_signature_verifier(
      [&](const mandate::schema::bytes_view_t&,
          const mandate::schema::address_t& principal,
          const mandate::schema::bytes_view_t& signature) {
        seen = principal;
        return signature.size() == 1 && signature[0] == 0x42;
      });

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  root.signature = mandate::schema::bytes_t{0x42};
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(seen, kAlice);
}

TEST(delegation_manager, relaxed_mode_ignores_verifiers) {
  auto world = mandate::testing::world_t{};
  world.fund(kToken, kAlice, 100);
  world.manager.set_signature_verifier(
      [](const mandate::schema::bytes_view_t&, const mandate::schema::address_t&,
         const mandate::schema::bytes_view_t&) { return false; });

  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  auto result = world.redeem(
      kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 1));
  EXPECT_EQ(result.code, 0u) << result.log;
}

TEST(delegation_manager, persisted_state_survives_restart) {
  auto db = mandate::testing::make_db_path("mandate_manager_persist");
  auto root = mandate::testing::make_root_delegation(kAlice, kBob);
  {
    auto storage =
        mandate::storage::make_storage<mandate::storage::rocksdb_storage_tag>(
            db);
    {
      auto world = mandate::testing::world_t{};
      world.fund(kToken, kAlice, 100);
      auto result = world.redeem(
          kBob, {root}, mandate::testing::make_token_transfer(kToken, kBob, 30));
      ASSERT_EQ(result.code, 0u) << result.log;
      ASSERT_EQ(world.manager.disable_delegation(kAlice, root).code, 0u);
      world.manager.increment_nonce(kAlice);
      world.manager.persist(storage, 1);
    }

    auto world = mandate::testing::world_t{};
    EXPECT_EQ(world.manager.restore(storage), std::optional<uint64_t>{1});
    EXPECT_EQ(world.balance(kToken, kAlice), 70);
    EXPECT_EQ(world.balance(kToken, kBob), 30);
    EXPECT_TRUE(
        world.manager.is_delegation_disabled(world.manager.delegation_hash(root)));
    EXPECT_EQ(mandate::enforcer::nonce_enforcer{}.current_nonce(
                  world.store, mandate::testing::kManagerAddress, kAlice),
              1);
  }
  mandate::testing::remove_path(db);
}
