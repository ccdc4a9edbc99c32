#include <tandem/execution/address_deriver.hpp>
#include <tandem/execution/delegated_authority.hpp>
#include <tandem/execution/engine.hpp>
#include <gtest/gtest.h>

#include <type_traits>

TEST(engine_types, defaults_are_stable) {
  auto registry = tandem::schema::registry_state_t{};
  EXPECT_EQ(registry.version, 1u);
  for (auto counter : registry.counters) {
    EXPECT_EQ(counter, 0u);
  }

  auto management = tandem::schema::management_state_t{};
  EXPECT_EQ(management.version, 1u);
  EXPECT_TRUE(management.unclaimed.empty());

  auto result = tandem::schema::operation_result_t{};
  EXPECT_TRUE(result.ok());
  EXPECT_EQ(result.error(), tandem::schema::error_code::ok);
  EXPECT_TRUE(result.events.empty());

  EXPECT_EQ(tandem::execution::engine::kRegistrySeed, "tandem::registry");
}

TEST(engine_types, credentials_cannot_be_duplicated) {
  static_assert(
      !std::is_copy_constructible_v<tandem::execution::delegated_authority>);
  static_assert(
      !std::is_copy_assignable_v<tandem::execution::delegated_authority>);
  static_assert(std::is_nothrow_move_constructible_v<
                tandem::execution::delegated_authority>);
  static_assert(
      !std::is_copy_constructible_v<tandem::schema::capability_state_t>);

  auto account = tandem::schema::account_id_t{};
  account[0] = 0x11;
  auto proof = tandem::schema::hash32_t{};
  proof[0] = 0x22;
  auto authority = tandem::execution::delegated_authority{account, proof};
  auto moved = std::move(authority);
  EXPECT_EQ(moved.account(), account);
  EXPECT_EQ(moved.proof(), proof);
}

TEST(engine_types, deriver_callback_type_compiles) {
  auto calls = 0;
  tandem::execution::address_deriver_t deriver =
      [&calls](const tandem::schema::account_id_t& parent,
               const tandem::schema::bytes_view_t&) {
        ++calls;
        return parent;
      };
  auto parent = tandem::schema::account_id_t{};
  parent[31] = 0x7F;
  EXPECT_EQ(deriver(parent, tandem::schema::bytes_view_t{}), parent);
  EXPECT_EQ(calls, 1);
}
